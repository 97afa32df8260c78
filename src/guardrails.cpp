#include <scribe/guardrails.h>

#include <scribe/paths.h>

#include <cctype>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace scribe {
namespace {

std::string Label(const Citation &citation) {
  return citation.file_path + ":" + std::to_string(citation.line_start) + "-" +
         std::to_string(citation.line_end);
}

GuardrailResult Fail(const std::string &check, std::string reason) {
  return GuardrailResult{check, false, std::move(reason)};
}

std::string Trim(const std::string &value) {
  auto begin = value.begin();
  auto end = value.end();
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
    ++begin;
  }
  while (end != begin &&
         std::isspace(static_cast<unsigned char>(*(end - 1)))) {
    --end;
  }
  return std::string(begin, end);
}

} // namespace

FilesystemSourceReader::FilesystemSourceReader(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<std::filesystem::path>
FilesystemSourceReader::Resolve(const std::string &path) const {
  const auto candidate = (root_ / path).lexically_normal();
  if (!IsWithin(candidate, root_)) {
    return std::nullopt;
  }
  return candidate;
}

bool FilesystemSourceReader::FileExists(const std::string &path) const {
  const auto resolved = Resolve(path);
  std::error_code error;
  return resolved && std::filesystem::is_regular_file(*resolved, error);
}

std::optional<std::size_t>
FilesystemSourceReader::CountLines(const std::string &path) const {
  const auto resolved = Resolve(path);
  if (!resolved) {
    return std::nullopt;
  }
  std::ifstream stream(*resolved, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  std::size_t count = 0;
  std::string line;
  while (std::getline(stream, line)) {
    ++count;
  }
  if (stream.bad()) {
    return std::nullopt;
  }
  return count;
}

GuardrailEvaluator::GuardrailEvaluator(
    std::shared_ptr<const SourceReader> reader, GuardrailConfig config,
    std::shared_ptr<Logger> logger)
    : reader_(std::move(reader)), config_(config),
      logger_(EnsureLogger(std::move(logger))) {
  if (!reader_) {
    throw std::invalid_argument("GuardrailEvaluator requires a source reader.");
  }
}

GuardrailResult GuardrailEvaluator::VerifyCitation(
    const Citation &citation) const {
  const auto &path = citation.file_path;
  if (!reader_->FileExists(path)) {
    return Fail("citation_file_exists", "File not found: " + path);
  }
  if (citation.line_start < 1) {
    return Fail("citation_line_start",
                "line_start < 1 in " + path + ":" +
                    std::to_string(citation.line_start));
  }
  if (citation.line_end < citation.line_start) {
    return Fail("citation_line_range",
                "line_end < line_start in " + Label(citation));
  }
  const auto line_count = reader_->CountLines(path);
  if (!line_count) {
    return Fail("citation_file_readable", "Cannot read file: " + path);
  }
  if (static_cast<std::size_t>(citation.line_end) > *line_count) {
    return Fail("citation_line_end",
                "line_end (" + std::to_string(citation.line_end) +
                    ") exceeds file length (" + std::to_string(*line_count) +
                    ") in " + Label(citation));
  }
  return GuardrailResult{"citation_valid", true, std::nullopt};
}

std::vector<GuardrailResult> GuardrailEvaluator::VerifyCitations(
    const std::vector<Citation> &citations) const {
  std::vector<GuardrailResult> results;
  results.reserve(citations.size());
  for (const auto &citation : citations) {
    results.push_back(VerifyCitation(citation));
    if (!results.back().passed) {
      logger_->Log(LogLevel::kDebug, "guardrail.citation.failed",
                   {{"check", results.back().check_name},
                    {"reason", results.back().reason.value_or("")}});
    }
  }
  return results;
}

std::string GuardrailEvaluator::ValidateInput(const std::string &text) const {
  auto trimmed = Trim(text);
  if (trimmed.empty()) {
    throw std::invalid_argument("Input is empty");
  }
  if (trimmed.size() > config_.max_input_length) {
    logger_->Log(LogLevel::kWarn, "guardrail.input.truncated",
                 {{"length", std::to_string(trimmed.size())},
                  {"max", std::to_string(config_.max_input_length)}});
    trimmed.resize(config_.max_input_length);
  }
  return trimmed;
}

GatedContent GuardrailEvaluator::GateLowConfidence(const std::string &content,
                                                   double confidence) const {
  if (confidence >= config_.confidence_threshold) {
    return GatedContent{content, false};
  }
  char disclaimer[48];
  std::snprintf(disclaimer, sizeof(disclaimer), "[Low confidence: %.2f] ",
                confidence);
  return GatedContent{disclaimer + content, true};
}

} // namespace scribe
