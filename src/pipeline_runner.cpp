#include <scribe/pipeline_runner.h>

#include <scribe/chunk_analyzer.h>
#include <scribe/confidence_scorer.h>
#include <scribe/cross_validator.h>
#include <scribe/errors.h>
#include <scribe/ingestion.h>
#include <scribe/intelligence_model.h>
#include <scribe/local_source_resolver.h>
#include <scribe/parallel_group.h>
#include <scribe/section_generator.h>
#include <scribe/stream_events.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace scribe {
namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point started) {
  return std::chrono::duration<double, std::milli>(Clock::now() - started)
      .count();
}

StageStatus ToStatus(const StageResult &result) {
  return StageStatus{result.stage_name,
                     result.outcome == StageOutcome::kCompleted,
                     result.duration_ms, result.error};
}

void ThrowIfCancelled(const RunContext &context, const std::string &stage) {
  if (context.cancellation) {
    context.cancellation->ThrowIfCancelled(stage);
  }
}

// Serialises the caller's progress callback and mirrors stage boundaries
// into trace events.
class StageReporter {
public:
  StageReporter(const RunContext &context, const TraceDispatcher &dispatcher,
                std::string trace_id, Logger &logger)
      : context_(&context), dispatcher_(&dispatcher),
        trace_id_(std::move(trace_id)), logger_(&logger) {}

  void StageStarted(const std::string &stage, const std::string &message) {
    StageEvent event;
    event.name = stage;
    event.status = StageProgress::kRunning;
    event.message = message;
    Publish(event);
    EmitStageStart(*dispatcher_, trace_id_, stage);
  }

  void Tick(const StageEvent &event) { Publish(event); }

  StageStatus StageFinished(const StageResult &result,
                            const std::string &done_message) {
    const auto status = ToStatus(result);
    StageEvent event;
    event.name = status.name;
    event.status = status.ok ? StageProgress::kDone : StageProgress::kError;
    event.message = status.ok ? done_message : status.error.value_or("");
    event.duration_ms = status.duration_ms;
    Publish(event);
    EmitStageEnd(*dispatcher_, trace_id_, status.name, status.duration_ms,
                 status.ok, status.error);
    if (!status.ok) {
      logger_->Log(LogLevel::kWarn, "pipeline.stage.failed",
                   {{"stage", status.name},
                    {"error", status.error.value_or("")}});
    } else {
      logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
                   {{"stage", status.name}, {"message", done_message}});
    }
    return status;
  }

  void PhaseStarted(const std::string &phase, const std::string &message) {
    {
      std::lock_guard<std::mutex> lock(phase_mutex_);
      phase_started_[phase] = Clock::now();
    }
    StageEvent event;
    event.name = phase;
    event.status = StageProgress::kRunning;
    event.message = message;
    Publish(event);
    EmitPhaseStart(*dispatcher_, trace_id_, phase);
  }

  void PhaseFinished(const std::string &phase, const std::string &message) {
    double duration_ms = 0.0;
    {
      std::lock_guard<std::mutex> lock(phase_mutex_);
      const auto found = phase_started_.find(phase);
      if (found != phase_started_.end()) {
        duration_ms = ElapsedMs(found->second);
      }
    }
    StageEvent event;
    event.name = phase;
    event.status = StageProgress::kDone;
    event.message = message;
    event.duration_ms = duration_ms;
    Publish(event);
    EmitPhaseEnd(*dispatcher_, trace_id_, phase, duration_ms);
  }

private:
  void Publish(const StageEvent &event) {
    if (!context_->on_progress) {
      return;
    }
    std::lock_guard<std::mutex> lock(callback_mutex_);
    context_->on_progress(event);
  }

  const RunContext *context_;
  const TraceDispatcher *dispatcher_;
  std::string trace_id_;
  Logger *logger_;
  std::mutex callback_mutex_;
  std::mutex phase_mutex_;
  std::map<std::string, Clock::time_point> phase_started_;
};

// Runs one sequential stage. `body` returns the DONE message.
template <typename Body>
StageStatus RunStage(const RunContext &context, StageReporter &reporter,
                     const std::string &name, const std::string &message,
                     Body body) {
  ThrowIfCancelled(context, name);
  reporter.StageStarted(name, message);
  std::string done_message;
  const PipelineStage stage(name, [&] { done_message = body(); });
  return reporter.StageFinished(stage.Run(), done_message);
}

std::string Count(std::size_t value, const std::string &noun) {
  return std::to_string(value) + " " + noun;
}

} // namespace

bool IsFoundationalStage(const std::string &stage_name) {
  return stage_name == "ingestion_resolve" ||
         stage_name == "intelligence_model";
}

SectionOutput MakeDegradedSection(const std::string &section_name,
                                  const std::string &error) {
  SectionOutput section;
  section.section_name = section_name;
  section.title = section_name;
  for (const auto &spec : SectionCatalog()) {
    if (spec.name == section_name) {
      section.title = spec.title;
    }
  }
  section.content = "# " + section.title +
                    "\n\n*This section could not be generated: " + error +
                    "*\n";
  section.confidence = 0.0;
  section.degraded = true;
  return section;
}

PipelineRunner::PipelineRunner(PipelineComponents components)
    : resolver_(std::move(components.resolver)),
      language_detector_(std::move(components.language_detector)),
      chunker_(std::move(components.chunker)),
      static_analyzer_(std::move(components.static_analyzer)),
      chunk_analyzer_(std::move(components.chunk_analyzer)),
      section_generator_(std::move(components.section_generator)),
      result_store_(std::move(components.result_store)),
      source_reader_factory_(std::move(components.source_reader_factory)),
      dispatcher_(std::move(components.dispatcher)),
      logger_(EnsureLogger(std::move(components.logger))),
      options_(std::move(components.options)) {
  if (!resolver_ || !language_detector_ || !chunker_ || !static_analyzer_ ||
      !chunk_analyzer_ || !section_generator_) {
    throw std::invalid_argument("PipelineRunner is missing a component.");
  }
  if (!source_reader_factory_) {
    source_reader_factory_ = [](const SourceTree &tree) {
      return std::make_shared<FilesystemSourceReader>(tree.root);
    };
  }
  if (!dispatcher_) {
    dispatcher_ = std::make_shared<TraceDispatcher>(logger_);
  }
}

RunResult PipelineRunner::Run(const RunContext &context) const {
  if (context.project_id.empty()) {
    throw std::invalid_argument("RunContext.project_id must not be empty.");
  }
  const auto started = Clock::now();
  const auto trace_id = "run:" + context.project_id;
  RunResult result;
  result.project_id = context.project_id;

  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"project_id", context.project_id},
                {"repo_path", context.repo_path}});
  EmitPipelineStart(*dispatcher_, trace_id, context.project_id);
  try {
    Execute(context, trace_id, result);
  } catch (const std::exception &ex) {
    EmitPipelineEnd(*dispatcher_, trace_id, ElapsedMs(started), false);
    logger_->Log(LogLevel::kWarn, "pipeline.interrupted",
                 {{"project_id", context.project_id}, {"error", ex.what()}});
    throw;
  }

  result.total_duration_ms = ElapsedMs(started);
  result.partial = std::any_of(
      result.stages.begin(), result.stages.end(), [](const StageStatus &stage) {
        return !stage.ok && !IsFoundationalStage(stage.name);
      });
  EmitPipelineEnd(*dispatcher_, trace_id, result.total_duration_ms,
                  !result.aborted && !result.partial);
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"project_id", context.project_id},
                {"duration_ms",
                 std::to_string(static_cast<long long>(result.total_duration_ms))},
                {"partial", result.partial ? "true" : "false"},
                {"aborted", result.aborted ? "true" : "false"}});
  return result;
}

std::vector<std::string> PipelineRunner::RequestedSections() const {
  const auto supported = section_generator_->SupportedSections();
  if (options_.sections.empty()) {
    return supported;
  }
  std::vector<std::string> sections;
  for (const auto &name : options_.sections) {
    if (std::find(supported.begin(), supported.end(), name) ==
        supported.end()) {
      logger_->Log(LogLevel::kWarn, "pipeline.section.unknown",
                   {{"section", name}});
      continue;
    }
    if (std::find(sections.begin(), sections.end(), name) == sections.end()) {
      sections.push_back(name);
    }
  }
  return sections;
}

void PipelineRunner::Execute(const RunContext &context,
                             const std::string &trace_id,
                             RunResult &result) const {
  StageReporter reporter(context, *dispatcher_, trace_id, *logger_);

  SourceTree tree;
  result.stages.push_back(RunStage(
      context, reporter, "ingestion_resolve", "Resolving repository path...",
      [&] {
        tree = resolver_->Resolve(context.repo_path, context.branch);
        return "Found " + Count(tree.files.size(), "files");
      }));
  if (!result.stages.back().ok) {
    result.aborted = true;
    return;
  }

  LanguageMap languages;
  result.stages.push_back(RunStage(
      context, reporter, "ingestion_detect", "Detecting languages...", [&] {
        languages = language_detector_->Detect(tree);
        return "Detected " + Count(languages.language_counts.size(),
                                   "languages");
      }));

  ChunkedFiles chunks;
  result.stages.push_back(RunStage(
      context, reporter, "ingestion_chunk", "Splitting source files...", [&] {
        chunks = chunker_->Chunk(tree, languages);
        return "Created " + Count(chunks.chunks.size(), "chunks") + " from " +
               Count(static_cast<std::size_t>(chunks.total_files), "files");
      }));

  // Static and model analysis only share read-only inputs.
  ThrowIfCancelled(context, "dual_analysis");
  StaticAnalysisResult static_result;
  LlmAnalysisResult llm_result;
  ChunkAnalysisContext chunk_context{
      context.project_id, trace_id,
      [&reporter](const StageEvent &tick) { reporter.Tick(tick); },
      context.cancellation.get()};
  const std::map<std::string, std::string> running_messages = {
      {"static_analysis",
       "Parsing " + Count(languages.file_languages.size(), "files")},
      {"llm_analysis", "Analyzing " + Count(chunks.chunks.size(), "chunks")}};
  std::map<std::string, std::string> done_messages;
  std::mutex done_mutex;

  reporter.PhaseStarted("dual_analysis", "Running static and AI analysis");
  const ParallelGroup dual_analysis(
      "dual_analysis",
      {PipelineStage("static_analysis",
                     [&] {
                       static_result =
                           static_analyzer_->Analyze(tree, languages, chunks);
                       std::lock_guard<std::mutex> lock(done_mutex);
                       done_messages["static_analysis"] =
                           "Found " +
                           Count(static_result.ast_forest.entities.size(),
                                 "entities") +
                           ", " +
                           Count(static_result.api_endpoints.endpoints.size(),
                                 "endpoints");
                     }),
       PipelineStage("llm_analysis",
                     [&] {
                       llm_result =
                           chunk_analyzer_->Analyze(chunks, chunk_context);
                       std::lock_guard<std::mutex> lock(done_mutex);
                       done_messages["llm_analysis"] =
                           "Analyzed " +
                           Count(static_cast<std::size_t>(
                                     llm_result.analyzed_chunks),
                                 "chunks") +
                           " (" + std::to_string(llm_result.resumed_chunks) +
                           " resumed)";
                     })},
      0, logger_, options_.group_timeout);
  const auto analysis_results = dual_analysis.Execute(StageObserver{
      [&](const std::string &stage) {
        reporter.StageStarted(stage, running_messages.at(stage));
      },
      [&](const StageResult &stage) {
        std::string message;
        {
          std::lock_guard<std::mutex> lock(done_mutex);
          message = done_messages[stage.stage_name];
        }
        reporter.StageFinished(stage, message);
      }});
  for (const auto &stage : analysis_results) {
    result.stages.push_back(ToStatus(stage));
    // An overdue stage may still have written its output before the join.
    if (stage.outcome == StageOutcome::kFailed) {
      if (stage.stage_name == "static_analysis") {
        static_result = StaticAnalysisResult{};
      } else {
        llm_result = LlmAnalysisResult{};
      }
    }
  }
  reporter.PhaseFinished("dual_analysis", "Static and AI analysis finished");

  ValidationResult validation;
  result.stages.push_back(RunStage(
      context, reporter, "quality", "Scoring confidence...", [&] {
        validation = CrossValidate(static_result, llm_result);
        return "Scored " + Count(validation.entities.size(), "findings") +
               " (" + std::to_string(validation.cross_validated_count) +
               " cross-validated)";
      }));

  std::optional<IntelligenceModel> model;
  result.stages.push_back(RunStage(
      context, reporter, "intelligence_model",
      "Building intelligence model...", [&] {
        model = BuildIntelligenceModel(context.project_id, languages,
                                       static_result, llm_result, validation);
        return "Modelled " + Count(model->entities.size(), "entities");
      }));
  if (!result.stages.back().ok || !model) {
    result.aborted = true;
    return;
  }
  result.model = model;

  const GuardrailEvaluator guardrails(source_reader_factory_(tree),
                                      options_.guardrails, logger_);

  ThrowIfCancelled(context, "section_generation");
  const auto section_names = RequestedSections();
  std::vector<SectionOutput> sections(section_names.size());
  std::vector<PipelineStage> section_stages;
  for (std::size_t index = 0; index < section_names.size(); ++index) {
    section_stages.emplace_back(
        "generate_" + section_names[index], [&, index] {
          ThrowIfCancelled(context, "generate_" + section_names[index]);
          auto section =
              section_generator_->Generate(section_names[index], *model);
          section.confidence = ClampConfidence(section.confidence);
          auto gated =
              guardrails.GateLowConfidence(section.content, section.confidence);
          section.content = std::move(gated.content);
          section.gated = gated.gated;
          sections[index] = std::move(section);
        });
  }

  reporter.PhaseStarted("section_generation",
                        "Generating " +
                            Count(section_names.size(), "sections"));
  const ParallelGroup generation("section_generation",
                                 std::move(section_stages),
                                 options_.max_concurrency, logger_,
                                 options_.group_timeout);
  const auto generation_results = generation.Execute(StageObserver{
      [&](const std::string &stage) {
        reporter.StageStarted(stage, StageLabel(stage) + "...");
      },
      [&](const StageResult &stage) {
        reporter.StageFinished(stage, "Section ready");
      }});
  std::size_t degraded = 0;
  for (std::size_t index = 0; index < generation_results.size(); ++index) {
    const auto &stage = generation_results[index];
    result.stages.push_back(ToStatus(stage));
    if (stage.outcome != StageOutcome::kCompleted) {
      sections[index] = MakeDegradedSection(
          section_names[index], stage.error.value_or("not generated"));
      ++degraded;
    }
  }
  result.sections = std::move(sections);
  reporter.PhaseFinished("section_generation",
                         "Generated " + Count(result.sections.size(),
                                              "sections") +
                             " (" + std::to_string(degraded) + " degraded)");

  std::size_t citation_count = 0;
  for (const auto &section : result.sections) {
    citation_count += section.citations.size();
  }
  if (citation_count > 0) {
    result.stages.push_back(RunStage(
        context, reporter, "citation_verification",
        "Verifying " + Count(citation_count, "citations") + "...", [&] {
          QualityReport report;
          double confidence_sum = 0.0;
          for (const auto &section : result.sections) {
            for (auto &check : guardrails.VerifyCitations(section.citations)) {
              ++report.citations_checked;
              if (check.passed) {
                ++report.citations_valid;
              }
              report.guardrail_results.push_back(std::move(check));
            }
            confidence_sum += section.confidence;
          }
          report.avg_confidence =
              confidence_sum / static_cast<double>(result.sections.size());
          const auto summary = std::to_string(report.citations_valid) +
                               " of " +
                               std::to_string(report.citations_checked) +
                               " citations valid";
          result.quality_report = std::move(report);
          return summary;
        }));
  }

  if (result_store_) {
    result.stages.push_back(RunStage(
        context, reporter, "persistence", "Saving results...", [&] {
          result_store_->Persist(result);
          return "Saved " + Count(result.sections.size(), "sections");
        }));
  }
}

PipelineRunnerBuilder &
PipelineRunnerBuilder::WithResolver(std::unique_ptr<SourceResolver> resolver) {
  components_.resolver = std::move(resolver);
  return *this;
}

PipelineRunnerBuilder &PipelineRunnerBuilder::WithLanguageDetector(
    std::unique_ptr<LanguageDetector> detector) {
  components_.language_detector = std::move(detector);
  return *this;
}

PipelineRunnerBuilder &
PipelineRunnerBuilder::WithChunker(std::unique_ptr<Chunker> chunker) {
  components_.chunker = std::move(chunker);
  return *this;
}

PipelineRunnerBuilder &PipelineRunnerBuilder::WithStaticAnalyzer(
    std::unique_ptr<StaticAnalyzer> static_analyzer) {
  components_.static_analyzer = std::move(static_analyzer);
  return *this;
}

PipelineRunnerBuilder &PipelineRunnerBuilder::WithChunkAnalyzer(
    std::unique_ptr<ChunkAnalyzer> chunk_analyzer) {
  components_.chunk_analyzer = std::move(chunk_analyzer);
  return *this;
}

PipelineRunnerBuilder &PipelineRunnerBuilder::WithSectionGenerator(
    std::unique_ptr<SectionGenerator> generator) {
  components_.section_generator = std::move(generator);
  return *this;
}

PipelineRunnerBuilder &
PipelineRunnerBuilder::WithResultStore(std::shared_ptr<ResultStore> store) {
  components_.result_store = std::move(store);
  return *this;
}

PipelineRunnerBuilder &
PipelineRunnerBuilder::WithSourceReaderFactory(SourceReaderFactory factory) {
  components_.source_reader_factory = std::move(factory);
  return *this;
}

PipelineRunnerBuilder &PipelineRunnerBuilder::WithDispatcher(
    std::shared_ptr<TraceDispatcher> dispatcher) {
  components_.dispatcher = std::move(dispatcher);
  return *this;
}

PipelineRunnerBuilder &
PipelineRunnerBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

PipelineRunnerBuilder &
PipelineRunnerBuilder::WithOptions(PipelineOptions options) {
  components_.options = std::move(options);
  return *this;
}

std::unique_ptr<PipelineRunner> PipelineRunnerBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  const auto &logger = components_.logger;
  if (!components_.resolver) {
    components_.resolver = std::make_unique<LocalSourceResolver>(
        std::vector<std::string>{}, logger);
  }
  if (!components_.language_detector) {
    components_.language_detector =
        std::make_unique<ExtensionLanguageDetector>(logger);
  }
  if (!components_.chunker) {
    components_.chunker = std::make_unique<LineChunker>(200, logger);
  }
  if (!components_.static_analyzer) {
    components_.static_analyzer = std::make_unique<StaticAnalyzer>(
        MakeDefaultStaticAnalyzerComponents(logger), logger);
  }
  if (!components_.chunk_analyzer) {
    components_.chunk_analyzer = std::make_unique<ModelChunkAnalyzer>(
        nullptr, std::vector<std::string>{}, nullptr, ChunkAnalysisOptions{},
        logger);
  }
  if (!components_.section_generator) {
    components_.section_generator =
        std::make_unique<SynthesizingSectionGenerator>(
            nullptr, std::vector<std::string>{}, std::chrono::seconds(120),
            logger);
  }
  return std::make_unique<PipelineRunner>(std::move(components_));
}

} // namespace scribe
