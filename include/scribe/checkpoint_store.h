#pragma once

#include <scribe/logging.h>
#include <scribe/models.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace scribe {

// Chunk-level results keyed by project and chunk content hash, so an
// interrupted analysis resumes where it stopped.
class CheckpointStore {
public:
  virtual ~CheckpointStore() = default;
  virtual std::optional<std::string> Get(const std::string &project_id,
                                         const std::string &content_hash) = 0;
  virtual void Put(const std::string &project_id,
                   const std::string &content_hash,
                   const std::string &payload) = 0;
  virtual std::size_t Count(const std::string &project_id) const = 0;
  virtual void Invalidate(const std::string &project_id) = 0;
};

std::string ChunkContentHash(const CodeChunk &chunk);

class InMemoryCheckpointStore : public CheckpointStore {
public:
  std::optional<std::string> Get(const std::string &project_id,
                                 const std::string &content_hash) override;
  void Put(const std::string &project_id, const std::string &content_hash,
           const std::string &payload) override;
  std::size_t Count(const std::string &project_id) const override;
  void Invalidate(const std::string &project_id) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::map<std::string, std::string>> entries_;
};

// One file per checkpoint under <directory>/<project>/.
class DirectoryCheckpointStore : public CheckpointStore {
public:
  DirectoryCheckpointStore(std::filesystem::path directory,
                           std::shared_ptr<Logger> logger = nullptr);

  std::optional<std::string> Get(const std::string &project_id,
                                 const std::string &content_hash) override;
  void Put(const std::string &project_id, const std::string &content_hash,
           const std::string &payload) override;
  std::size_t Count(const std::string &project_id) const override;
  void Invalidate(const std::string &project_id) override;

  // Removes every checkpoint of every project.
  void Clean() const;
  const std::filesystem::path &Directory() const { return directory_; }

private:
  std::filesystem::path ProjectDirectory(const std::string &project_id) const;
  std::filesystem::path EntryPath(const std::string &project_id,
                                  const std::string &content_hash) const;

  std::filesystem::path directory_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
};

} // namespace scribe
