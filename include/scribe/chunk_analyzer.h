#pragma once

#include <scribe/checkpoint_store.h>
#include <scribe/interfaces.h>
#include <scribe/logging.h>
#include <scribe/resilient_caller.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

// Checkpoint payload of one analysed chunk.
std::string EncodeNarrative(const ChunkNarrative &narrative);
std::optional<ChunkNarrative> DecodeNarrative(const std::string &payload);

// First non-empty line is the summary; "- " or "* " lines are behaviors.
ChunkNarrative ParseNarrative(const CodeChunk &chunk,
                              const std::string &content);

struct ChunkAnalysisOptions {
  std::chrono::seconds call_timeout{120};
  // Chunks described at the same time.
  std::size_t max_concurrency = 2;
  // Chunks not started by then are left out of the result.
  std::chrono::milliseconds analysis_timeout{std::chrono::seconds(900)};
};

// Asks the model chain to describe every code chunk. Chunks already in the
// checkpoint store are not sent again. A chunk that fails is counted and
// skipped; the other chunks still complete.
class ModelChunkAnalyzer : public ChunkAnalyzer {
public:
  ModelChunkAnalyzer(std::shared_ptr<ResilientCaller> caller,
                     std::vector<std::string> model_chain,
                     std::shared_ptr<CheckpointStore> checkpoints,
                     ChunkAnalysisOptions options = {},
                     std::shared_ptr<Logger> logger = nullptr);

  LlmAnalysisResult Analyze(const ChunkedFiles &chunks,
                            const ChunkAnalysisContext &context) override;

private:
  enum class ChunkOutcome { kAnalyzed, kResumed, kFailed };

  ModelRequest BuildRequest(const CodeChunk &chunk) const;
  ChunkOutcome AnalyzeChunk(const CodeChunk &chunk,
                            const ChunkAnalysisContext &context,
                            std::optional<ChunkNarrative> &narrative);
  void StoreCheckpoint(const std::string &project_id, const std::string &hash,
                       const ChunkNarrative &narrative);

  std::shared_ptr<ResilientCaller> caller_;
  std::vector<std::string> model_chain_;
  std::shared_ptr<CheckpointStore> checkpoints_;
  ChunkAnalysisOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
