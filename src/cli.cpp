#include <scribe/cli.h>

#include <scribe/analysis_service.h>
#include <scribe/checkpoint_store.h>
#include <scribe/chunk_analyzer.h>
#include <scribe/ingestion.h>
#include <scribe/local_source_resolver.h>
#include <scribe/result_store.h>
#include <scribe/section_generator.h>
#include <scribe/static_analyzer.h>
#include <scribe/stream_events.h>
#include <scribe/trace_handlers.h>

#include <iostream>
#include <stdexcept>

namespace scribe {
namespace {

constexpr const char *kCheckpointDirectoryName = ".scribe_cache";
constexpr const char *kOutputDirectoryName = ".scribe_output";

void PrintAnalyzeUsage(std::ostream &out) {
  out << "Usage: scribe analyze --root <path> [options]\n"
      << "Options:\n"
      << "  --root <path>          Repository to document\n"
      << "  --config <file>        Optional YAML config file\n"
      << "  --out <path>           Directory for generated sections\n"
      << "                         (default: <root>/.scribe_output)\n"
      << "  --project-id <id>      Project identifier (default: root name)\n"
      << "  --branch <name>        Branch recorded for the run (default: main)\n"
      << "  --sections <list>      Comma-separated sections to generate\n"
      << "  --models <list>        Comma-separated model fallback chain\n"
      << "  --checkpoint-dir <path> Chunk checkpoint directory\n"
      << "                         (default: <root>/.scribe_cache)\n"
      << "  --ignored-paths <list> Comma-separated paths to skip\n"
      << "  --max-concurrency <n>  Sections generated in parallel\n"
      << "  --llm-concurrency <n>  Chunks described in parallel (default: 2)\n"
      << "  --analysis-timeout <s> Deadline for chunk analysis (default: 900)\n"
      << "  --log-level <level>    Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose              Shortcut for --log-level info\n"
      << "  --debug                Shortcut for --log-level debug\n"
      << "  --help                 Show this message\n";
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeArguments &parsed) {
  const auto &argument = arguments[index];
  auto &settings = parsed.settings;
  if (argument == "--help" || argument == "-h") {
    parsed.show_help = true;
    return true;
  }
  if (argument == "--config") {
    settings.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--verbose") {
    settings.log_level = LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    settings.log_level = LogLevel::kDebug;
    return true;
  }

  // Every other flag mirrors a config key.
  static const std::vector<std::pair<std::string, std::string>> flag_keys = {
      {"--root", "root"},
      {"--out", "out"},
      {"--project-id", "project_id"},
      {"--branch", "branch"},
      {"--sections", "sections"},
      {"--models", "model_chain"},
      {"--checkpoint-dir", "checkpoint_dir"},
      {"--ignored-paths", "ignored_paths"},
      {"--max-concurrency", "analysis_max_concurrency"},
      {"--llm-concurrency", "llm_max_concurrency"},
      {"--analysis-timeout", "analysis_timeout_seconds"},
      {"--log-level", "log_level"}};
  for (const auto &[flag, key] : flag_keys) {
    if (argument == flag) {
      ApplySetting(key, RequireValue(arguments, index, flag), settings);
      return true;
    }
  }
  return false;
}

std::vector<std::string>
ResolveIgnoredPaths(const std::vector<std::string> &paths,
                    const std::filesystem::path &root) {
  std::vector<std::string> resolved;
  resolved.reserve(paths.size());
  for (const auto &value : paths) {
    std::filesystem::path path(value);
    if (!path.is_absolute()) {
      path = root / path;
    }
    resolved.push_back(std::filesystem::weakly_canonical(path).generic_string());
  }
  return resolved;
}

} // namespace

AnalyzeArguments
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeArguments parsed;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, parsed)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (parsed.show_help) {
      break;
    }
  }
  return parsed;
}

CheckpointCleanArguments
ParseCheckpointCleanArguments(const std::vector<std::string> &arguments) {
  CheckpointCleanArguments parsed;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--root") {
      parsed.root = RequireValue(arguments, i, argument);
      continue;
    }
    if (argument == "--dir") {
      parsed.directory = RequireValue(arguments, i, argument);
      continue;
    }
    if (argument == "--help" || argument == "-h") {
      parsed.show_help = true;
      return parsed;
    }
    throw std::invalid_argument("Unknown checkpoints argument: " + argument);
  }
  return parsed;
}

int RunExitCode(const RunResult &result) {
  if (result.aborted) {
    return 1;
  }
  return result.partial ? 2 : 0;
}

std::unique_ptr<PipelineRunner>
BuildAnalysisRunner(const Settings &settings, const std::filesystem::path &root,
                    std::shared_ptr<Logger> logger,
                    std::shared_ptr<TraceDispatcher> dispatcher,
                    std::shared_ptr<ModelClient> client) {
  logger = EnsureLogger(std::move(logger));
  std::shared_ptr<ResilientCaller> caller;
  if (client) {
    caller = std::make_shared<ResilientCaller>(
        std::move(client), BuildRetryPolicy(settings),
        BuildBreakerPolicy(settings), logger, dispatcher);
  } else if (!settings.model_chain.empty()) {
    logger->Log(LogLevel::kWarn, "model.client.unavailable",
                {{"models", std::to_string(settings.model_chain.size())}});
  }

  const auto timeout = BuildModelTimeout(settings);
  auto checkpoints = std::make_shared<DirectoryCheckpointStore>(
      settings.checkpoint_directory.value_or(root / kCheckpointDirectoryName),
      logger);
  auto results = std::make_shared<DirectoryResultStore>(
      settings.output_directory.value_or(root / kOutputDirectoryName), logger);

  PipelineRunnerBuilder builder;
  builder.WithLogger(logger)
      .WithDispatcher(std::move(dispatcher))
      .WithOptions(BuildPipelineOptions(settings))
      .WithResolver(std::make_unique<LocalSourceResolver>(
          ResolveIgnoredPaths(settings.ignored_paths, root), logger))
      .WithChunker(
          std::make_unique<LineChunker>(BuildChunkLines(settings), logger))
      .WithChunkAnalyzer(std::make_unique<ModelChunkAnalyzer>(
          caller, settings.model_chain, std::move(checkpoints),
          BuildChunkAnalysisOptions(settings), logger))
      .WithSectionGenerator(std::make_unique<SynthesizingSectionGenerator>(
          caller, settings.model_chain, timeout, logger))
      .WithResultStore(std::move(results));
  return builder.Build();
}

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &log) {
  const auto parsed = ParseAnalyzeArguments(arguments);
  if (parsed.show_help) {
    PrintAnalyzeUsage(out);
    return 0;
  }

  const auto settings = ResolveSettings(parsed.settings);
  const auto root = std::filesystem::weakly_canonical(*settings.root);
  const auto project_id = ResolveProjectId(settings, root);
  auto logger = MakeLogger(BuildLoggingConfig(settings), log);

  auto dispatcher = std::make_shared<TraceDispatcher>(logger);
  dispatcher->Register(
      std::make_shared<ConsoleTraceHandler>(logger, LogLevel::kDebug));
  auto costs = std::make_shared<CostAggregatorHandler>();
  dispatcher->Register(costs);

  AnalysisService service(
      BuildAnalysisRunner(settings, root, logger, dispatcher), nullptr,
      nullptr, logger);
  auto stream =
      service.Start(project_id, root.string(), settings.branch.value_or("main"));

  auto last_kind = StreamEventKind::kStage;
  while (const auto envelope = stream->Next()) {
    out << FormatWireEvent(*envelope);
    out.flush();
    last_kind = envelope->kind;
  }
  if (last_kind != StreamEventKind::kComplete) {
    return 1;
  }

  const auto result = service.Wait(project_id);
  const auto cost = costs->CostFor("run:" + project_id);
  logger->Log(LogLevel::kInfo, "analysis.cost",
              {{"project_id", project_id},
               {"calls", std::to_string(cost.call_count)},
               {"input_tokens", std::to_string(cost.input_tokens)},
               {"output_tokens", std::to_string(cost.output_tokens)},
               {"total_cost", std::to_string(cost.total_cost)}});
  return RunExitCode(result);
}

int RunCheckpointClean(const std::vector<std::string> &arguments,
                       std::ostream &out) {
  const auto parsed = ParseCheckpointCleanArguments(arguments);
  if (parsed.show_help) {
    out << "Usage: scribe checkpoints clean (--dir <path> | --root <path>)\n";
    return 0;
  }
  if (!parsed.directory && !parsed.root) {
    throw std::invalid_argument(
        "--dir or --root is required for checkpoints clean");
  }

  const auto directory =
      parsed.directory ? *parsed.directory
                       : std::filesystem::weakly_canonical(*parsed.root) /
                             kCheckpointDirectoryName;
  if (!std::filesystem::exists(directory)) {
    out << "No checkpoint directory found at " << directory << "\n";
    return 0;
  }
  DirectoryCheckpointStore(directory).Clean();
  out << "Removed checkpoints at " << directory << "\n";
  return 0;
}

int RunCheckpointsCommand(const std::vector<std::string> &arguments,
                          std::ostream &out) {
  if (arguments.empty()) {
    out << "Checkpoints subcommand requires an action (e.g., clean).\n";
    return 1;
  }
  const std::string &action = arguments.front();
  if (action == "clean") {
    const std::vector<std::string> clean_arguments(arguments.begin() + 1,
                                                   arguments.end());
    return RunCheckpointClean(clean_arguments, out);
  }
  out << "Unknown checkpoints subcommand: " << action << "\n";
  return 1;
}

} // namespace scribe
