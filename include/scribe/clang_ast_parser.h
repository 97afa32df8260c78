#pragma once

#include <scribe/interfaces.h>
#include <scribe/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace scribe {

// Parses the C and C++ files of a source tree with libclang and records
// definitions, call sites and fields located inside the tree. Files that
// fail to parse are logged and skipped.
class ClangAstParser : public AstParser {
public:
  explicit ClangAstParser(std::vector<std::string> extra_args = {},
                          std::shared_ptr<Logger> logger = nullptr);
  AstForest Parse(const SourceTree &tree,
                  const LanguageMap &languages) override;

private:
  std::vector<std::string> extra_args_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
