#include <scribe/checkpoint_store.h>

#include <scribe/escaping.h>

#include <openssl/evp.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace scribe {
namespace {

constexpr char kHeader[] = "# scribe checkpoint v1";
constexpr char kExtension[] = ".chk";

// Keeps project ids usable as directory names. Anything outside
// [A-Za-z0-9._-] becomes %XX, and '%' itself is escaped, so distinct ids
// never share a directory.
std::string SafeName(const std::string &value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  if (value.empty()) {
    return "%";
  }
  const bool dots_only = value == "." || value == "..";
  std::string safe;
  safe.reserve(value.size());
  for (const auto character : value) {
    const auto byte = static_cast<unsigned char>(character);
    const bool plain = (character >= 'a' && character <= 'z') ||
                       (character >= 'A' && character <= 'Z') ||
                       (character >= '0' && character <= '9') ||
                       character == '-' || character == '_' ||
                       (character == '.' && !dots_only);
    if (plain) {
      safe.push_back(character);
    } else {
      safe.push_back('%');
      safe.push_back(kHex[byte >> 4]);
      safe.push_back(kHex[byte & 0x0F]);
    }
  }
  return safe;
}

std::string HexDigest(const unsigned char *digest, unsigned int length) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

} // namespace

std::string ChunkContentHash(const CodeChunk &chunk) {
  std::string payload = chunk.file_path;
  payload.push_back('\0');
  payload.append(std::to_string(chunk.start_line));
  payload.push_back('\0');
  payload.append(std::to_string(chunk.end_line));
  payload.push_back('\0');
  payload.append(chunk.content);

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_Digest(payload.data(), payload.size(), digest, &length,
                 EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed for " + chunk.file_path);
  }
  return HexDigest(digest, length);
}

std::optional<std::string>
InMemoryCheckpointStore::Get(const std::string &project_id,
                             const std::string &content_hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto project = entries_.find(project_id);
  if (project == entries_.end()) {
    return std::nullopt;
  }
  const auto entry = project->second.find(content_hash);
  if (entry == project->second.end()) {
    return std::nullopt;
  }
  return entry->second;
}

void InMemoryCheckpointStore::Put(const std::string &project_id,
                                  const std::string &content_hash,
                                  const std::string &payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[project_id][content_hash] = payload;
}

std::size_t InMemoryCheckpointStore::Count(const std::string &project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto project = entries_.find(project_id);
  return project == entries_.end() ? 0 : project->second.size();
}

void InMemoryCheckpointStore::Invalidate(const std::string &project_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(project_id);
}

DirectoryCheckpointStore::DirectoryCheckpointStore(
    std::filesystem::path directory, std::shared_ptr<Logger> logger)
    : directory_(std::filesystem::weakly_canonical(directory)),
      logger_(EnsureLogger(std::move(logger))) {}

std::optional<std::string>
DirectoryCheckpointStore::Get(const std::string &project_id,
                              const std::string &content_hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto path = EntryPath(project_id, content_hash);
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    return std::nullopt;
  }
  std::ifstream stream(path);
  if (!stream) {
    logger_->Log(LogLevel::kWarn, "checkpoint.read.failed",
                 {{"path", path.string()}});
    return std::nullopt;
  }
  std::string header;
  std::string payload;
  if (!std::getline(stream, header) || header != kHeader ||
      !std::getline(stream, payload)) {
    logger_->Log(LogLevel::kWarn, "checkpoint.malformed",
                 {{"path", path.string()}});
    return std::nullopt;
  }
  return UnescapeField(payload);
}

void DirectoryCheckpointStore::Put(const std::string &project_id,
                                   const std::string &content_hash,
                                   const std::string &payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto path = EntryPath(project_id, content_hash);
  std::error_code error;
  std::filesystem::create_directories(path.parent_path(), error);
  if (error) {
    logger_->Log(LogLevel::kWarn, "checkpoint.write.failed",
                 {{"path", path.string()}, {"error", error.message()}});
    return;
  }
  std::ofstream stream(path, std::ios::trunc);
  if (!stream) {
    logger_->Log(LogLevel::kWarn, "checkpoint.write.failed",
                 {{"path", path.string()}});
    return;
  }
  stream << kHeader << '\n' << EscapeField(payload) << '\n';
  if (!stream.flush()) {
    logger_->Log(LogLevel::kWarn, "checkpoint.write.failed",
                 {{"path", path.string()}});
  }
}

std::size_t DirectoryCheckpointStore::Count(const std::string &project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto project_dir = ProjectDirectory(project_id);
  std::error_code error;
  if (!std::filesystem::is_directory(project_dir, error)) {
    return 0;
  }
  std::size_t count = 0;
  for (const auto &entry : std::filesystem::directory_iterator(project_dir)) {
    if (entry.is_regular_file() && entry.path().extension() == kExtension) {
      ++count;
    }
  }
  return count;
}

void DirectoryCheckpointStore::Invalidate(const std::string &project_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto project_dir = ProjectDirectory(project_id);
  const auto removed = std::filesystem::remove_all(project_dir);
  logger_->Log(LogLevel::kInfo, "checkpoint.invalidated",
               {{"project_id", project_id},
                {"removed", std::to_string(removed)}});
}

void DirectoryCheckpointStore::Clean() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::filesystem::exists(directory_)) {
    std::filesystem::remove_all(directory_);
    logger_->Log(LogLevel::kInfo, "checkpoint.cleaned",
                 {{"directory", directory_.string()}});
  }
}

std::filesystem::path
DirectoryCheckpointStore::ProjectDirectory(const std::string &project_id) const {
  return directory_ / SafeName(project_id);
}

std::filesystem::path
DirectoryCheckpointStore::EntryPath(const std::string &project_id,
                                    const std::string &content_hash) const {
  return ProjectDirectory(project_id) / (SafeName(content_hash) + kExtension);
}

} // namespace scribe
