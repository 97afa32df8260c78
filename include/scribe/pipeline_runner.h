#pragma once

#include <scribe/cancellation.h>
#include <scribe/guardrails.h>
#include <scribe/interfaces.h>
#include <scribe/logging.h>
#include <scribe/static_analyzer.h>
#include <scribe/trace_dispatcher.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

struct RunContext {
  std::string project_id;
  std::string repo_path;
  std::string branch = "main";
  // Invoked once per StageEvent, possibly from worker threads but never
  // concurrently.
  ProgressCallback on_progress;
  std::shared_ptr<CancellationToken> cancellation;
};

struct PipelineOptions {
  // Empty selects every section the generator supports.
  std::vector<std::string> sections;
  std::size_t max_concurrency = 4;
  // Deadline of each parallel group; stages still running then fail.
  std::optional<std::chrono::milliseconds> group_timeout;
  GuardrailConfig guardrails;
};

using SourceReaderFactory =
    std::function<std::shared_ptr<const SourceReader>(const SourceTree &)>;

struct PipelineComponents {
  std::unique_ptr<SourceResolver> resolver;
  std::unique_ptr<LanguageDetector> language_detector;
  std::unique_ptr<Chunker> chunker;
  std::unique_ptr<StaticAnalyzer> static_analyzer;
  std::unique_ptr<ChunkAnalyzer> chunk_analyzer;
  std::unique_ptr<SectionGenerator> section_generator;
  // Optional; persistence is skipped without one.
  std::shared_ptr<ResultStore> result_store;
  SourceReaderFactory source_reader_factory;
  std::shared_ptr<TraceDispatcher> dispatcher;
  std::shared_ptr<Logger> logger;
  PipelineOptions options;
};

// Stage names that abort the run when they fail.
bool IsFoundationalStage(const std::string &stage_name);

SectionOutput MakeDegradedSection(const std::string &section_name,
                                  const std::string &error);

// Drives one analysis run through ingestion, dual analysis, validation,
// modelling, section generation, citation checks and persistence. A
// failing stage is recorded and replaced by its empty result; only
// foundational stages stop the run. Safe to call concurrently for
// different projects.
class PipelineRunner {
public:
  explicit PipelineRunner(PipelineComponents components);

  // Throws CancelledError when the context's token is cancelled.
  RunResult Run(const RunContext &context) const;

  const PipelineOptions &Options() const { return options_; }

private:
  void Execute(const RunContext &context, const std::string &trace_id,
               RunResult &result) const;
  std::vector<std::string> RequestedSections() const;

  std::unique_ptr<SourceResolver> resolver_;
  std::unique_ptr<LanguageDetector> language_detector_;
  std::unique_ptr<Chunker> chunker_;
  std::unique_ptr<StaticAnalyzer> static_analyzer_;
  std::unique_ptr<ChunkAnalyzer> chunk_analyzer_;
  std::unique_ptr<SectionGenerator> section_generator_;
  std::shared_ptr<ResultStore> result_store_;
  SourceReaderFactory source_reader_factory_;
  std::shared_ptr<TraceDispatcher> dispatcher_;
  std::shared_ptr<Logger> logger_;
  PipelineOptions options_;
};

class PipelineRunnerBuilder {
public:
  PipelineRunnerBuilder &WithResolver(std::unique_ptr<SourceResolver> resolver);
  PipelineRunnerBuilder &
  WithLanguageDetector(std::unique_ptr<LanguageDetector> detector);
  PipelineRunnerBuilder &WithChunker(std::unique_ptr<Chunker> chunker);
  PipelineRunnerBuilder &
  WithStaticAnalyzer(std::unique_ptr<StaticAnalyzer> static_analyzer);
  PipelineRunnerBuilder &
  WithChunkAnalyzer(std::unique_ptr<ChunkAnalyzer> chunk_analyzer);
  PipelineRunnerBuilder &
  WithSectionGenerator(std::unique_ptr<SectionGenerator> generator);
  PipelineRunnerBuilder &WithResultStore(std::shared_ptr<ResultStore> store);
  PipelineRunnerBuilder &WithSourceReaderFactory(SourceReaderFactory factory);
  PipelineRunnerBuilder &
  WithDispatcher(std::shared_ptr<TraceDispatcher> dispatcher);
  PipelineRunnerBuilder &WithLogger(std::shared_ptr<Logger> logger);
  PipelineRunnerBuilder &WithOptions(PipelineOptions options);

  // Missing components get the local defaults: filesystem resolver,
  // extension detector, line chunker, libclang static analysis and
  // template-only chunk analysis and sections.
  std::unique_ptr<PipelineRunner> Build();

private:
  PipelineComponents components_;
};

} // namespace scribe
