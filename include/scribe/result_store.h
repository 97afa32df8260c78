#pragma once

#include <scribe/interfaces.h>
#include <scribe/logging.h>

#include <filesystem>
#include <memory>
#include <string>

namespace scribe {

std::string RenderSummaryJson(const RunResult &result);

// Writes <directory>/<project>/<section>.md for every section and a
// summary.json describing the run.
class DirectoryResultStore : public ResultStore {
public:
  explicit DirectoryResultStore(std::filesystem::path directory,
                                std::shared_ptr<Logger> logger = nullptr);
  void Persist(const RunResult &result) override;
  std::filesystem::path ProjectDirectory(const std::string &project_id) const;

private:
  std::filesystem::path directory_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
