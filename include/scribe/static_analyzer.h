#pragma once

#include <scribe/interfaces.h>
#include <scribe/logging.h>

#include <memory>

namespace scribe {

struct StaticAnalyzerComponents {
  std::unique_ptr<AstParser> parser;
  std::unique_ptr<CallGraphBuilder> call_graph;
  std::unique_ptr<DependencyExtractor> dependencies;
  std::unique_ptr<SchemaExtractor> schemas;
  std::unique_ptr<EndpointDiscoverer> endpoints;
};

StaticAnalyzerComponents MakeDefaultStaticAnalyzerComponents(
    std::shared_ptr<Logger> logger = nullptr);

// Parses first, then runs the four extractors concurrently. An extractor
// that throws is logged and contributes its empty default; a parse failure
// propagates.
class StaticAnalyzer {
public:
  StaticAnalyzer(StaticAnalyzerComponents components,
                 std::shared_ptr<Logger> logger = nullptr);

  StaticAnalysisResult Analyze(const SourceTree &tree,
                               const LanguageMap &languages,
                               const ChunkedFiles &chunks);

private:
  StaticAnalyzerComponents components_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
