#include <scribe/local_source_resolver.h>

#include <scribe/paths.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace scribe {
namespace {

bool IsSkippedDirectoryName(const std::string &name) {
  static const std::set<std::string> kSkipped = {
      ".git",  ".hg",          ".svn",         "node_modules", "__pycache__",
      ".venv", "venv",         "build",        "dist",         ".idea",
      ".vs",   ".scribe_cache", ".scribe_output"};
  return kSkipped.count(name) > 0;
}

bool IsIgnoredPath(const std::filesystem::path &path,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  return std::any_of(
      ignored_paths.begin(), ignored_paths.end(),
      [&](const auto &ignored) { return IsWithin(path, ignored); });
}

std::filesystem::path ResolveRootPath(const std::string &repo_path) {
  if (repo_path.empty()) {
    throw std::invalid_argument("Repository path must not be empty.");
  }
  const auto root = std::filesystem::weakly_canonical(repo_path);
  if (!std::filesystem::exists(root) || !std::filesystem::is_directory(root)) {
    throw std::runtime_error("Repository path is not a directory: " +
                             root.string());
  }
  return root;
}

std::vector<std::string>
CollectFiles(const std::filesystem::path &root,
             const std::vector<std::filesystem::path> &ignored_paths) {
  std::vector<std::string> files;
  for (std::filesystem::recursive_directory_iterator it(
           root, std::filesystem::directory_options::skip_permission_denied),
       end;
       it != end; ++it) {
    const auto &entry = *it;
    if (entry.is_directory()) {
      if (IsSkippedDirectoryName(entry.path().filename().string()) ||
          IsIgnoredPath(entry.path(), ignored_paths)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file() ||
        IsIgnoredPath(entry.path(), ignored_paths)) {
      continue;
    }
    files.push_back(RelativeTo(entry.path(), root));
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

} // namespace

LocalSourceResolver::LocalSourceResolver(std::vector<std::string> ignored_paths,
                                         std::shared_ptr<Logger> logger)
    : ignored_paths_(std::move(ignored_paths)),
      logger_(EnsureLogger(std::move(logger))) {}

SourceTree LocalSourceResolver::Resolve(const std::string &repo_path,
                                        const std::string &branch) {
  const auto root = ResolveRootPath(repo_path);

  std::vector<std::filesystem::path> ignored;
  ignored.reserve(ignored_paths_.size());
  for (const auto &path : ignored_paths_) {
    const std::filesystem::path candidate(path);
    ignored.push_back(candidate.is_absolute() ? candidate : root / candidate);
  }

  auto files = CollectFiles(root, ignored);
  if (files.empty()) {
    throw std::runtime_error("No source files found under root: " +
                             root.string());
  }

  logger_->Log(LogLevel::kInfo, "ingestion.resolved",
               {{"root", root.string()},
                {"count", std::to_string(files.size())}});

  SourceTree tree;
  tree.root = root.string();
  tree.branch = branch;
  tree.files = std::move(files);
  return tree;
}

} // namespace scribe
