#include <scribe/chunk_analyzer.h>

#include <scribe/errors.h>
#include <scribe/escaping.h>
#include <scribe/ingestion.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <future>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace scribe {
namespace {

constexpr char kSystemPrompt[] =
    "You document source code. Reply with a one line summary of the chunk, "
    "then one line per notable behavior starting with \"- \". Wrap every "
    "identifier you mention in backticks.";

std::string Trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\r");
  return value.substr(first, last - first + 1);
}

double Percent(int completed, int total) {
  if (total <= 0) {
    return 100.0;
  }
  return std::round(static_cast<double>(completed) * 1000.0 / total) / 10.0;
}

} // namespace

std::string EncodeNarrative(const ChunkNarrative &narrative) {
  std::vector<std::string> fields = {narrative.file_path,
                                     std::to_string(narrative.start_line),
                                     std::to_string(narrative.end_line),
                                     narrative.summary};
  fields.insert(fields.end(), narrative.behaviors.begin(),
                narrative.behaviors.end());
  return JoinRecord(fields);
}

std::optional<ChunkNarrative> DecodeNarrative(const std::string &payload) {
  const auto fields = SplitRecord(payload);
  if (fields.size() < 4) {
    return std::nullopt;
  }
  ChunkNarrative narrative;
  narrative.file_path = fields[0];
  try {
    narrative.start_line = std::stoi(fields[1]);
    narrative.end_line = std::stoi(fields[2]);
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
  narrative.summary = fields[3];
  narrative.behaviors.assign(fields.begin() + 4, fields.end());
  return narrative;
}

ChunkNarrative ParseNarrative(const CodeChunk &chunk,
                              const std::string &content) {
  ChunkNarrative narrative;
  narrative.file_path = chunk.file_path;
  narrative.start_line = chunk.start_line;
  narrative.end_line = chunk.end_line;

  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    const auto text = Trim(line);
    if (text.empty()) {
      continue;
    }
    if (text.rfind("- ", 0) == 0 || text.rfind("* ", 0) == 0) {
      const auto behavior = Trim(text.substr(2));
      if (!behavior.empty()) {
        narrative.behaviors.push_back(behavior);
      }
      continue;
    }
    if (narrative.summary.empty()) {
      narrative.summary = text;
    }
  }
  return narrative;
}

ModelChunkAnalyzer::ModelChunkAnalyzer(
    std::shared_ptr<ResilientCaller> caller,
    std::vector<std::string> model_chain,
    std::shared_ptr<CheckpointStore> checkpoints, ChunkAnalysisOptions options,
    std::shared_ptr<Logger> logger)
    : caller_(std::move(caller)), model_chain_(std::move(model_chain)),
      checkpoints_(std::move(checkpoints)), options_(options),
      logger_(EnsureLogger(std::move(logger))) {
  if (options_.max_concurrency == 0) {
    options_.max_concurrency = 1;
  }
}

ModelRequest ModelChunkAnalyzer::BuildRequest(const CodeChunk &chunk) const {
  ModelRequest request;
  request.timeout = options_.call_timeout;
  request.messages = {
      {"system", kSystemPrompt},
      {"user", "File: " + chunk.file_path + " (lines " +
                   std::to_string(chunk.start_line) + "-" +
                   std::to_string(chunk.end_line) + ", " + chunk.language +
                   ")\n\n" + chunk.content}};
  request.min_content_length = 10;
  return request;
}

void ModelChunkAnalyzer::StoreCheckpoint(const std::string &project_id,
                                         const std::string &hash,
                                         const ChunkNarrative &narrative) {
  try {
    checkpoints_->Put(project_id, hash, EncodeNarrative(narrative));
  } catch (const std::exception &ex) {
    logger_->Log(LogLevel::kWarn, "checkpoint.write.failed",
                 {{"file", narrative.file_path}, {"error", ex.what()}});
  }
}

ModelChunkAnalyzer::ChunkOutcome
ModelChunkAnalyzer::AnalyzeChunk(const CodeChunk &chunk,
                                 const ChunkAnalysisContext &context,
                                 std::optional<ChunkNarrative> &narrative) {
  const auto hash = ChunkContentHash(chunk);
  if (checkpoints_) {
    if (const auto cached = checkpoints_->Get(context.project_id, hash)) {
      narrative = DecodeNarrative(*cached);
      if (narrative) {
        return ChunkOutcome::kResumed;
      }
    }
  }

  const auto response = caller_->CallWithFallback(
      model_chain_, BuildRequest(chunk), context.trace_id);
  if (!response) {
    return ChunkOutcome::kFailed;
  }
  narrative = ParseNarrative(chunk, response->content);
  if (checkpoints_) {
    StoreCheckpoint(context.project_id, hash, *narrative);
  }
  return ChunkOutcome::kAnalyzed;
}

LlmAnalysisResult
ModelChunkAnalyzer::Analyze(const ChunkedFiles &chunks,
                            const ChunkAnalysisContext &context) {
  LlmAnalysisResult result;
  if (!caller_ || model_chain_.empty()) {
    logger_->Log(LogLevel::kInfo, "llm.analysis.disabled",
                 {{"reason", "no model chain configured"}});
    return result;
  }

  std::vector<const CodeChunk *> pending;
  for (const auto &chunk : chunks.chunks) {
    if (IsCodeLanguage(chunk.language)) {
      pending.push_back(&chunk);
    }
  }

  const auto total = static_cast<int>(pending.size());
  const auto deadline =
      std::chrono::steady_clock::now() + options_.analysis_timeout;
  std::vector<std::optional<ChunkNarrative>> narratives(pending.size());
  std::atomic<std::size_t> next{0};
  std::atomic<bool> timed_out{false};
  std::mutex progress_mutex;
  int completed = 0;

  const auto work = [&] {
    for (auto index = next.fetch_add(1); index < pending.size();
         index = next.fetch_add(1)) {
      if (context.cancellation != nullptr) {
        context.cancellation->ThrowIfCancelled("chunk analysis");
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        timed_out.store(true);
        next.store(pending.size());
        return;
      }

      const auto &chunk = *pending[index];
      auto outcome = ChunkOutcome::kFailed;
      try {
        outcome = AnalyzeChunk(chunk, context, narratives[index]);
      } catch (const CancelledError &) {
        throw;
      } catch (const std::exception &ex) {
        narratives[index].reset();
        logger_->Log(LogLevel::kWarn, "llm.chunk.failed",
                     {{"file", chunk.file_path}, {"error", ex.what()}});
      }

      std::lock_guard<std::mutex> lock(progress_mutex);
      switch (outcome) {
      case ChunkOutcome::kAnalyzed:
        ++result.analyzed_chunks;
        break;
      case ChunkOutcome::kResumed:
        ++result.resumed_chunks;
        break;
      case ChunkOutcome::kFailed:
        ++result.failed_chunks;
        break;
      }
      ++completed;
      if (context.on_progress) {
        StageEvent tick;
        tick.name = "llm_analysis";
        tick.status = StageProgress::kRunning;
        tick.message = "Analyzed " + std::to_string(completed) + "/" +
                       std::to_string(total) + " chunks";
        tick.completed = completed;
        tick.total = total;
        tick.percent = Percent(completed, total);
        context.on_progress(tick);
      }
    }
  };

  const auto worker_count = std::min(options_.max_concurrency, pending.size());
  std::vector<std::future<void>> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.push_back(std::async(std::launch::async, work));
  }
  // Every worker is joined before a cancellation leaves this frame.
  std::exception_ptr cancellation;
  for (auto &worker : workers) {
    try {
      worker.get();
    } catch (const CancelledError &) {
      if (!cancellation) {
        cancellation = std::current_exception();
      }
      next.store(pending.size());
    }
  }
  if (cancellation) {
    std::rethrow_exception(cancellation);
  }

  for (auto &narrative : narratives) {
    if (narrative) {
      result.narratives.push_back(std::move(*narrative));
    }
  }
  if (timed_out.load()) {
    logger_->Log(LogLevel::kWarn, "llm.analysis.timeout",
                 {{"timeout_ms",
                   std::to_string(options_.analysis_timeout.count())},
                  {"completed", std::to_string(completed)},
                  {"total", std::to_string(total)}});
  }
  logger_->Log(LogLevel::kInfo, "llm.analysis.complete",
               {{"analyzed", std::to_string(result.analyzed_chunks)},
                {"resumed", std::to_string(result.resumed_chunks)},
                {"failed", std::to_string(result.failed_chunks)}});
  return result;
}

} // namespace scribe
