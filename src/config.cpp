#include <scribe/config.h>

#include <scribe/section_generator.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

namespace scribe {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsListKey(const std::string &key) {
  return key == "model_chain" || key == "sections" || key == "ignored_paths";
}

int ParseInteger(const std::string &key, const std::string &raw, int minimum) {
  const auto value = Trim(raw);
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be an integer, got: " + raw);
  }
  if (consumed != value.size()) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be an integer, got: " + raw);
  }
  if (parsed < minimum) {
    throw std::invalid_argument("Config key '" + key + "' must be at least " +
                                std::to_string(minimum));
  }
  return parsed;
}

double ParseFraction(const std::string &key, const std::string &raw) {
  const auto value = Trim(raw);
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be a number, got: " + raw);
  }
  if (consumed != value.size() || parsed < 0.0 || parsed > 1.0) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be a number between 0 and 1");
  }
  return parsed;
}

void AppendUnique(const std::vector<std::string> &values,
                  std::vector<std::string> &target) {
  for (const auto &value : values) {
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(value);
    }
  }
}

std::vector<std::string> ParseSections(const std::string &raw) {
  const auto known = DefaultSectionNames();
  std::vector<std::string> sections;
  for (auto name : SplitList(raw)) {
    name = ToLower(name);
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      throw std::invalid_argument("Unknown section: " + name);
    }
    AppendUnique({name}, sections);
  }
  return sections;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

// Flattens a YAML value into the comma separated form ApplySetting takes.
std::string FlattenNode(const YAML::Node &node, const std::string &key) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsSequence() && IsListKey(key)) {
    std::string joined;
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key +
                                    "' must be a list of strings");
      }
      if (!joined.empty()) {
        joined += ",";
      }
      joined += child.as<std::string>();
    }
    return joined;
  }
  if (node.IsNull()) {
    return "";
  }
  throw std::invalid_argument("Config key '" + key +
                              (IsListKey(key)
                                   ? "' must be a string or list of strings"
                                   : "' must be a scalar value"));
}

template <typename T>
void Override(std::optional<T> &target, const std::optional<T> &source) {
  if (source) {
    target = source;
  }
}

} // namespace

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"root",
                                                "out",
                                                "project_id",
                                                "branch",
                                                "log_level",
                                                "model_chain",
                                                "llm_timeout_seconds",
                                                "analysis_max_concurrency",
                                                "llm_max_concurrency",
                                                "analysis_timeout_seconds",
                                                "group_timeout_seconds",
                                                "chunk_lines",
                                                "guardrail_threshold",
                                                "max_input_length",
                                                "sections",
                                                "checkpoint_dir",
                                                "retry_max_attempts",
                                                "retry_initial_wait_ms",
                                                "retry_max_wait_ms",
                                                "breaker_failure_threshold",
                                                "breaker_recovery_seconds",
                                                "ignored_paths"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_directory", "out"},
      {"project", "project_id"},
      {"models", "model_chain"},
      {"llm_models", "model_chain"},
      {"max_concurrency", "analysis_max_concurrency"},
      {"llm_concurrency", "llm_max_concurrency"},
      {"analysis_timeout", "analysis_timeout_seconds"},
      {"confidence_threshold", "guardrail_threshold"},
      {"checkpoint_directory", "checkpoint_dir"},
      {"cache_dir", "checkpoint_dir"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  const auto flush = [&] {
    auto value = Trim(current);
    if (!value.empty() &&
        std::find(values.begin(), values.end(), value) == values.end()) {
      values.push_back(std::move(value));
    }
    current.clear();
  };
  for (const auto character : raw_values) {
    if (character == ',') {
      flush();
    } else {
      current.push_back(character);
    }
  }
  flush();
  return values;
}

void ApplySetting(const std::string &raw_key, const std::string &value,
                  Settings &settings) {
  const auto key = NormalizeAndValidateKey(raw_key);
  if (key == "root") {
    settings.root = Trim(value);
  } else if (key == "out") {
    settings.output_directory = Trim(value);
  } else if (key == "project_id") {
    settings.project_id = Trim(value);
  } else if (key == "branch") {
    settings.branch = Trim(value);
  } else if (key == "log_level") {
    settings.log_level = ParseLogLevel(value);
  } else if (key == "model_chain") {
    settings.model_chain = SplitList(value);
  } else if (key == "sections") {
    settings.sections = ParseSections(value);
  } else if (key == "ignored_paths") {
    settings.ignored_paths.clear();
    for (const auto &path : SplitList(value)) {
      AppendUnique({std::filesystem::path(path).generic_string()},
                   settings.ignored_paths);
    }
  } else if (key == "checkpoint_dir") {
    settings.checkpoint_directory = Trim(value);
  } else if (key == "llm_timeout_seconds") {
    settings.llm_timeout_seconds = ParseInteger(key, value, 1);
  } else if (key == "analysis_max_concurrency") {
    settings.analysis_max_concurrency = ParseInteger(key, value, 1);
  } else if (key == "llm_max_concurrency") {
    settings.llm_max_concurrency = ParseInteger(key, value, 1);
  } else if (key == "analysis_timeout_seconds") {
    settings.analysis_timeout_seconds = ParseInteger(key, value, 1);
  } else if (key == "group_timeout_seconds") {
    settings.group_timeout_seconds = ParseInteger(key, value, 1);
  } else if (key == "chunk_lines") {
    settings.chunk_lines = ParseInteger(key, value, 1);
  } else if (key == "guardrail_threshold") {
    settings.guardrail_threshold = ParseFraction(key, value);
  } else if (key == "max_input_length") {
    settings.max_input_length = ParseInteger(key, value, 1);
  } else if (key == "retry_max_attempts") {
    settings.retry_max_attempts = ParseInteger(key, value, 1);
  } else if (key == "retry_initial_wait_ms") {
    settings.retry_initial_wait_ms = ParseInteger(key, value, 0);
  } else if (key == "retry_max_wait_ms") {
    settings.retry_max_wait_ms = ParseInteger(key, value, 0);
  } else if (key == "breaker_failure_threshold") {
    settings.breaker_failure_threshold = ParseInteger(key, value, 1);
  } else if (key == "breaker_recovery_seconds") {
    settings.breaker_recovery_seconds = ParseInteger(key, value, 0);
  } else {
    ThrowUnknownKey(raw_key);
  }
}

Settings ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &ex) {
    throw std::invalid_argument("Malformed config file " + path.string() +
                                ": " + ex.what());
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  Settings settings;
  settings.config_file = path;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    ApplySetting(key, FlattenNode(entry.second, key), settings);
  }
  return settings;
}

Settings MergeSettings(const Settings &base, const Settings &overrides) {
  Settings merged = base;
  Override(merged.root, overrides.root);
  Override(merged.output_directory, overrides.output_directory);
  Override(merged.config_file, overrides.config_file);
  Override(merged.checkpoint_directory, overrides.checkpoint_directory);
  Override(merged.project_id, overrides.project_id);
  Override(merged.branch, overrides.branch);
  Override(merged.log_level, overrides.log_level);
  Override(merged.llm_timeout_seconds, overrides.llm_timeout_seconds);
  Override(merged.analysis_max_concurrency,
           overrides.analysis_max_concurrency);
  Override(merged.llm_max_concurrency, overrides.llm_max_concurrency);
  Override(merged.analysis_timeout_seconds,
           overrides.analysis_timeout_seconds);
  Override(merged.group_timeout_seconds, overrides.group_timeout_seconds);
  Override(merged.chunk_lines, overrides.chunk_lines);
  Override(merged.guardrail_threshold, overrides.guardrail_threshold);
  Override(merged.max_input_length, overrides.max_input_length);
  Override(merged.retry_max_attempts, overrides.retry_max_attempts);
  Override(merged.retry_initial_wait_ms, overrides.retry_initial_wait_ms);
  Override(merged.retry_max_wait_ms, overrides.retry_max_wait_ms);
  Override(merged.breaker_failure_threshold,
           overrides.breaker_failure_threshold);
  Override(merged.breaker_recovery_seconds,
           overrides.breaker_recovery_seconds);

  if (!overrides.model_chain.empty()) {
    merged.model_chain = overrides.model_chain;
  }
  if (!overrides.sections.empty()) {
    merged.sections = overrides.sections;
  }
  if (!overrides.ignored_paths.empty()) {
    merged.ignored_paths = overrides.ignored_paths;
  }
  return merged;
}

Settings ResolveSettings(const Settings &cli_settings) {
  Settings file_settings;
  if (cli_settings.config_file) {
    file_settings = ParseConfigFile(*cli_settings.config_file);
  }
  auto merged = MergeSettings(file_settings, cli_settings);
  if (!merged.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
  if (merged.retry_initial_wait_ms && merged.retry_max_wait_ms &&
      *merged.retry_initial_wait_ms > *merged.retry_max_wait_ms) {
    throw std::invalid_argument(
        "retry_initial_wait_ms must not exceed retry_max_wait_ms");
  }
  return merged;
}

LoggingConfig BuildLoggingConfig(const Settings &settings) {
  LoggingConfig logging;
  logging.level = settings.log_level.value_or(LogLevel::kWarn);
  return logging;
}

PipelineOptions BuildPipelineOptions(const Settings &settings) {
  PipelineOptions options;
  options.sections = settings.sections;
  options.max_concurrency =
      static_cast<std::size_t>(settings.analysis_max_concurrency.value_or(4));
  if (settings.group_timeout_seconds) {
    options.group_timeout =
        std::chrono::seconds(*settings.group_timeout_seconds);
  }
  options.guardrails.confidence_threshold =
      settings.guardrail_threshold.value_or(
          options.guardrails.confidence_threshold);
  if (settings.max_input_length) {
    options.guardrails.max_input_length =
        static_cast<std::size_t>(*settings.max_input_length);
  }
  return options;
}

RetryPolicy BuildRetryPolicy(const Settings &settings) {
  RetryPolicy retry;
  retry.max_attempts = settings.retry_max_attempts.value_or(retry.max_attempts);
  if (settings.retry_initial_wait_ms) {
    retry.initial_wait =
        std::chrono::milliseconds(*settings.retry_initial_wait_ms);
  }
  if (settings.retry_max_wait_ms) {
    retry.max_wait = std::chrono::milliseconds(*settings.retry_max_wait_ms);
  }
  return retry;
}

BreakerPolicy BuildBreakerPolicy(const Settings &settings) {
  BreakerPolicy breaker;
  breaker.failure_threshold =
      settings.breaker_failure_threshold.value_or(breaker.failure_threshold);
  if (settings.breaker_recovery_seconds) {
    breaker.recovery_timeout =
        std::chrono::seconds(*settings.breaker_recovery_seconds);
  }
  return breaker;
}

std::chrono::seconds BuildModelTimeout(const Settings &settings) {
  return std::chrono::seconds(settings.llm_timeout_seconds.value_or(120));
}

ChunkAnalysisOptions BuildChunkAnalysisOptions(const Settings &settings) {
  ChunkAnalysisOptions options;
  options.call_timeout = BuildModelTimeout(settings);
  options.max_concurrency =
      static_cast<std::size_t>(settings.llm_max_concurrency.value_or(2));
  options.analysis_timeout =
      std::chrono::seconds(settings.analysis_timeout_seconds.value_or(900));
  return options;
}

int BuildChunkLines(const Settings &settings) {
  return settings.chunk_lines.value_or(200);
}

std::string ResolveProjectId(const Settings &settings,
                             const std::filesystem::path &root) {
  if (settings.project_id && !settings.project_id->empty()) {
    return *settings.project_id;
  }
  auto name = root.filename().string();
  if (name.empty()) {
    name = root.parent_path().filename().string();
  }
  if (name.empty()) {
    throw std::invalid_argument("Cannot derive a project id from root: " +
                                root.string() + " (pass --project-id)");
  }
  return name;
}

} // namespace scribe
