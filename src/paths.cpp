#include <scribe/paths.h>

#include <algorithm>
#include <iterator>

namespace scribe {

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }
  const auto parent = std::filesystem::weakly_canonical(potential_parent);
  const auto normalized = std::filesystem::weakly_canonical(candidate);
  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized.begin(), normalized.end()) &&
         std::equal(parent.begin(), parent.end(), normalized.begin());
}

std::string RelativeTo(const std::filesystem::path &path,
                       const std::filesystem::path &root) {
  return std::filesystem::weakly_canonical(path)
      .lexically_relative(std::filesystem::weakly_canonical(root))
      .generic_string();
}

} // namespace scribe
