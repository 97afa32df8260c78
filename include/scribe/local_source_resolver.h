#pragma once

#include <scribe/interfaces.h>
#include <scribe/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scribe {

// Lists the text source files under a local directory. Version control,
// build output and dependency folders are skipped, as are `ignored_paths`
// (relative to the root or absolute).
class LocalSourceResolver : public SourceResolver {
public:
  explicit LocalSourceResolver(std::vector<std::string> ignored_paths = {},
                               std::shared_ptr<Logger> logger = nullptr);
  SourceTree Resolve(const std::string &repo_path,
                     const std::string &branch) override;

private:
  std::vector<std::string> ignored_paths_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
