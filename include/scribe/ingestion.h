#pragma once

#include <scribe/interfaces.h>
#include <scribe/logging.h>

#include <memory>
#include <optional>
#include <string>

namespace scribe {

// Language name for a path, from its extension or well-known file name.
std::optional<std::string> LanguageForPath(const std::string &path);

// False for documentation and data formats (markdown, json, yaml, toml).
bool IsCodeLanguage(const std::string &language);

class ExtensionLanguageDetector : public LanguageDetector {
public:
  explicit ExtensionLanguageDetector(std::shared_ptr<Logger> logger = nullptr);
  LanguageMap Detect(const SourceTree &tree) override;

private:
  std::shared_ptr<Logger> logger_;
};

// Splits every detected file into chunks of at most `chunk_lines` lines.
// Binary files are skipped.
class LineChunker : public Chunker {
public:
  explicit LineChunker(int chunk_lines = 200,
                       std::shared_ptr<Logger> logger = nullptr);
  ChunkedFiles Chunk(const SourceTree &tree,
                     const LanguageMap &languages) override;

private:
  int chunk_lines_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
