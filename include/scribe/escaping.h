#pragma once

#include <string>
#include <vector>

namespace scribe {

// Checkpoint records are tab separated fields on a single line. Tabs,
// newlines and backslashes inside a field are backslash escaped.
std::string EscapeField(const std::string &value);
std::string UnescapeField(const std::string &value);
std::string JoinRecord(const std::vector<std::string> &fields);
std::vector<std::string> SplitRecord(const std::string &line);

std::string EscapeJsonString(const std::string &value);

} // namespace scribe
