#ifndef SCRIBE_TEST_SUPPORT_TEMPORARY_PROJECT_H
#define SCRIBE_TEST_SUPPORT_TEMPORARY_PROJECT_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace scribe {
namespace test {

// Throwaway source tree under the system temp directory, removed on
// destruction.
class TemporaryProject {
public:
  explicit TemporaryProject(const std::string &prefix = "scribe-project") {
    static std::atomic<int> sequence{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            (prefix + "-" + std::to_string(timestamp) + "-" +
             std::to_string(sequence.fetch_add(1)));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryProject() {
    std::error_code ignored;
    std::filesystem::remove_all(root_, ignored);
  }

  TemporaryProject(const TemporaryProject &) = delete;
  TemporaryProject &operator=(const TemporaryProject &) = delete;

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path, std::ios::binary);
    stream << content;
    return full_path;
  }

  std::string ReadFile(const std::filesystem::path &relative) const {
    std::ifstream stream(root_ / relative, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(stream),
                       std::istreambuf_iterator<char>());
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace test
} // namespace scribe

#endif // SCRIBE_TEST_SUPPORT_TEMPORARY_PROJECT_H
