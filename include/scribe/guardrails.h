#pragma once

#include <scribe/logging.h>
#include <scribe/models.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

// Read access to the analysed source tree. Paths are relative to its root.
class SourceReader {
public:
  virtual ~SourceReader() = default;
  virtual bool FileExists(const std::string &path) const = 0;
  // nullopt when the file cannot be read.
  virtual std::optional<std::size_t> CountLines(const std::string &path) const = 0;
};

class FilesystemSourceReader : public SourceReader {
public:
  explicit FilesystemSourceReader(std::filesystem::path root);
  bool FileExists(const std::string &path) const override;
  std::optional<std::size_t> CountLines(const std::string &path) const override;

private:
  std::optional<std::filesystem::path> Resolve(const std::string &path) const;

  std::filesystem::path root_;
};

struct GuardrailConfig {
  double confidence_threshold = 0.60;
  std::size_t max_input_length = 10000;
};

struct GatedContent {
  std::string content;
  bool gated = false;
};

class GuardrailEvaluator {
public:
  explicit GuardrailEvaluator(std::shared_ptr<const SourceReader> reader,
                              GuardrailConfig config = {},
                              std::shared_ptr<Logger> logger = nullptr);

  GuardrailResult VerifyCitation(const Citation &citation) const;
  std::vector<GuardrailResult>
  VerifyCitations(const std::vector<Citation> &citations) const;

  // Trimmed input, cut to max_input_length. Throws std::invalid_argument
  // when nothing is left after trimming.
  std::string ValidateInput(const std::string &text) const;

  GatedContent GateLowConfidence(const std::string &content,
                                 double confidence) const;

  const GuardrailConfig &Config() const { return config_; }

private:
  std::shared_ptr<const SourceReader> reader_;
  GuardrailConfig config_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
