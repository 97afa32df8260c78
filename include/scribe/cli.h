#pragma once

#include <scribe/config.h>
#include <scribe/logging.h>
#include <scribe/models.h>
#include <scribe/pipeline_runner.h>
#include <scribe/resilient_caller.h>
#include <scribe/trace_dispatcher.h>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

struct AnalyzeArguments {
  Settings settings;
  bool show_help = false;
};

struct CheckpointCleanArguments {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> directory;
  bool show_help = false;
};

AnalyzeArguments ParseAnalyzeArguments(const std::vector<std::string> &arguments);
CheckpointCleanArguments
ParseCheckpointCleanArguments(const std::vector<std::string> &arguments);

// 0 for a clean run, 2 when some stages degraded, 1 when the run aborted.
int RunExitCode(const RunResult &result);

// Wires the default collaborators for a local run. `client` may be null, in
// which case chunk analysis is skipped and sections use their templates.
std::unique_ptr<PipelineRunner>
BuildAnalysisRunner(const Settings &settings, const std::filesystem::path &root,
                    std::shared_ptr<Logger> logger,
                    std::shared_ptr<TraceDispatcher> dispatcher,
                    std::shared_ptr<ModelClient> client = nullptr);

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out,
               std::ostream &log);
int RunCheckpointClean(const std::vector<std::string> &arguments,
                       std::ostream &out);
int RunCheckpointsCommand(const std::vector<std::string> &arguments,
                          std::ostream &out);

} // namespace scribe
