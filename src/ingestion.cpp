#include <scribe/ingestion.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace scribe {
namespace {

constexpr std::size_t kBinarySniffBytes = 8192;

const std::map<std::string, std::string> &ExtensionLanguages() {
  static const std::map<std::string, std::string> languages = {
      {".c", "c"},           {".h", "cpp"},          {".cc", "cpp"},
      {".cpp", "cpp"},       {".cxx", "cpp"},        {".hh", "cpp"},
      {".hpp", "cpp"},       {".hxx", "cpp"},        {".ipp", "cpp"},
      {".py", "python"},     {".js", "javascript"},  {".jsx", "javascript"},
      {".mjs", "javascript"}, {".ts", "typescript"}, {".tsx", "typescript"},
      {".go", "go"},         {".rs", "rust"},        {".java", "java"},
      {".kt", "kotlin"},     {".rb", "ruby"},        {".php", "php"},
      {".cs", "csharp"},     {".swift", "swift"},    {".scala", "scala"},
      {".sh", "shell"},      {".sql", "sql"},        {".cmake", "cmake"},
      {".md", "markdown"},   {".json", "json"},      {".yml", "yaml"},
      {".yaml", "yaml"},     {".toml", "toml"},
  };
  return languages;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::tolower(character));
                 });
  return value;
}

bool LooksBinary(const std::string &content) {
  const auto scanned = std::min(content.size(), kBinarySniffBytes);
  return std::find(content.begin(), content.begin() + scanned, '\0') !=
         content.begin() + scanned;
}

std::optional<std::string> ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << stream.rdbuf();
  return buffer.str();
}

std::vector<std::string> SplitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

} // namespace

std::optional<std::string> LanguageForPath(const std::string &path) {
  const std::filesystem::path file(path);
  if (file.filename() == "CMakeLists.txt") {
    return std::string("cmake");
  }
  const auto &languages = ExtensionLanguages();
  const auto found = languages.find(ToLower(file.extension().string()));
  if (found == languages.end()) {
    return std::nullopt;
  }
  return found->second;
}

bool IsCodeLanguage(const std::string &language) {
  static const std::set<std::string> kDataLanguages = {"markdown", "json",
                                                       "yaml", "toml"};
  return kDataLanguages.count(language) == 0;
}

ExtensionLanguageDetector::ExtensionLanguageDetector(
    std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

LanguageMap ExtensionLanguageDetector::Detect(const SourceTree &tree) {
  LanguageMap languages;
  for (const auto &file : tree.files) {
    if (const auto language = LanguageForPath(file)) {
      languages.file_languages.emplace(file, *language);
      ++languages.language_counts[*language];
    }
  }
  logger_->Log(LogLevel::kInfo, "ingestion.languages",
               {{"files", std::to_string(languages.file_languages.size())},
                {"languages",
                 std::to_string(languages.language_counts.size())}});
  return languages;
}

LineChunker::LineChunker(int chunk_lines, std::shared_ptr<Logger> logger)
    : chunk_lines_(chunk_lines), logger_(EnsureLogger(std::move(logger))) {
  if (chunk_lines_ < 1) {
    throw std::invalid_argument("chunk_lines must be at least 1.");
  }
}

ChunkedFiles LineChunker::Chunk(const SourceTree &tree,
                                const LanguageMap &languages) {
  ChunkedFiles result;
  const std::filesystem::path root(tree.root);
  for (const auto &[file, language] : languages.file_languages) {
    const auto content = ReadFile(root / file);
    if (!content) {
      logger_->Log(LogLevel::kWarn, "ingestion.chunk.unreadable",
                   {{"file", file}});
      continue;
    }
    if (LooksBinary(*content)) {
      continue;
    }
    const auto lines = SplitLines(*content);
    if (lines.empty()) {
      continue;
    }
    ++result.total_files;
    const auto line_count = static_cast<int>(lines.size());
    for (int start = 0; start < line_count; start += chunk_lines_) {
      const auto end = std::min(line_count, start + chunk_lines_);
      CodeChunk chunk;
      chunk.file_path = file;
      chunk.language = language;
      chunk.start_line = start + 1;
      chunk.end_line = end;
      for (int index = start; index < end; ++index) {
        chunk.content.append(lines[static_cast<std::size_t>(index)]);
        chunk.content.push_back('\n');
      }
      result.chunks.push_back(std::move(chunk));
    }
  }
  logger_->Log(LogLevel::kInfo, "ingestion.chunked",
               {{"files", std::to_string(result.total_files)},
                {"chunks", std::to_string(result.chunks.size())}});
  return result;
}

} // namespace scribe
