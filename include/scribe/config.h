#pragma once

#include <scribe/chunk_analyzer.h>
#include <scribe/circuit_breaker.h>
#include <scribe/logging.h>
#include <scribe/pipeline_runner.h>
#include <scribe/resilient_caller.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

// Analysis settings gathered from a YAML file and command line flags. Unset
// values fall back to the defaults applied by the Build* helpers.
struct Settings {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> checkpoint_directory;
  std::optional<std::string> project_id;
  std::optional<std::string> branch;
  std::optional<LogLevel> log_level;
  std::vector<std::string> model_chain;
  std::vector<std::string> sections;
  std::vector<std::string> ignored_paths;
  std::optional<int> llm_timeout_seconds;
  std::optional<int> analysis_max_concurrency;
  std::optional<int> llm_max_concurrency;
  std::optional<int> analysis_timeout_seconds;
  std::optional<int> group_timeout_seconds;
  std::optional<int> chunk_lines;
  std::optional<double> guardrail_threshold;
  std::optional<int> max_input_length;
  std::optional<int> retry_max_attempts;
  std::optional<int> retry_initial_wait_ms;
  std::optional<int> retry_max_wait_ms;
  std::optional<int> breaker_failure_threshold;
  std::optional<int> breaker_recovery_seconds;
};

const std::vector<std::string> &SupportedConfigKeys();

// Lower case, '-' becomes '_', aliases resolved. Unknown keys are returned
// as normalised; validation is left to the caller.
std::string NormalizeConfigKey(std::string key);

// Throws std::invalid_argument for unknown keys or malformed values and
// std::runtime_error when the file is missing.
Settings ParseConfigFile(const std::filesystem::path &path);

// Applies one `key: value` pair. Lists are comma separated.
void ApplySetting(const std::string &key, const std::string &value,
                  Settings &settings);

// Values set in `overrides` win; lists replace rather than append.
Settings MergeSettings(const Settings &base, const Settings &overrides);

// Loads `config_file` when present, merges the command line on top and
// checks that a root is known.
Settings ResolveSettings(const Settings &cli_settings);

std::vector<std::string> SplitList(const std::string &raw_values);

LoggingConfig BuildLoggingConfig(const Settings &settings);
PipelineOptions BuildPipelineOptions(const Settings &settings);
RetryPolicy BuildRetryPolicy(const Settings &settings);
BreakerPolicy BuildBreakerPolicy(const Settings &settings);
std::chrono::seconds BuildModelTimeout(const Settings &settings);
ChunkAnalysisOptions BuildChunkAnalysisOptions(const Settings &settings);
int BuildChunkLines(const Settings &settings);

// Explicit project id, or the name of the root directory.
std::string ResolveProjectId(const Settings &settings,
                             const std::filesystem::path &root);

} // namespace scribe
