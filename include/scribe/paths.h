#pragma once

#include <filesystem>
#include <string>

namespace scribe {

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent);

// '/' separated path of `path` relative to `root`.
std::string RelativeTo(const std::filesystem::path &path,
                       const std::filesystem::path &root);

} // namespace scribe
