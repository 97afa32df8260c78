#include <scribe/static_analyzer.h>

#include <scribe/clang_ast_parser.h>
#include <scribe/errors.h>
#include <scribe/static_extractors.h>

#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>

namespace scribe {
namespace {

// Runs `extract` on its own thread. Failures degrade to a default value.
template <typename Result, typename Extract>
std::future<Result> LaunchExtractor(const std::string &name,
                                    const std::shared_ptr<Logger> &logger,
                                    Extract extract) {
  return std::async(std::launch::async, [name, logger, extract]() {
    try {
      return extract();
    } catch (const CancelledError &) {
      throw;
    } catch (const std::exception &ex) {
      logger->Log(LogLevel::kWarn, "static.extractor.failed",
                  {{"extractor", name}, {"error", ex.what()}});
      return Result{};
    }
  });
}

} // namespace

StaticAnalyzerComponents
MakeDefaultStaticAnalyzerComponents(std::shared_ptr<Logger> logger) {
  StaticAnalyzerComponents components;
  components.parser = std::make_unique<ClangAstParser>(
      std::vector<std::string>{}, std::move(logger));
  components.call_graph = std::make_unique<AstCallGraphBuilder>();
  components.dependencies = std::make_unique<SourceDependencyExtractor>();
  components.schemas = std::make_unique<AstSchemaExtractor>();
  components.endpoints = std::make_unique<RouteEndpointDiscoverer>();
  return components;
}

StaticAnalyzer::StaticAnalyzer(StaticAnalyzerComponents components,
                               std::shared_ptr<Logger> logger)
    : components_(std::move(components)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!components_.parser || !components_.call_graph ||
      !components_.dependencies || !components_.schemas ||
      !components_.endpoints) {
    throw std::invalid_argument("StaticAnalyzer requires every component.");
  }
}

StaticAnalysisResult StaticAnalyzer::Analyze(const SourceTree &tree,
                                             const LanguageMap &languages,
                                             const ChunkedFiles &chunks) {
  StaticAnalysisResult result;
  // Parsing is CPU bound; keep it off the calling thread.
  auto parsing = std::async(std::launch::async, [&] {
    return components_.parser->Parse(tree, languages);
  });
  result.ast_forest = parsing.get();
  const auto &forest = result.ast_forest;

  auto call_graph = LaunchExtractor<CallGraph>(
      "call_graph", logger_,
      [this, &forest] { return components_.call_graph->Build(forest); });
  auto dependencies = LaunchExtractor<DependencyGraph>(
      "dependency_graph", logger_, [this, &forest, &chunks] {
        return components_.dependencies->Extract(forest, chunks);
      });
  auto schemas = LaunchExtractor<SchemaMap>(
      "schema_extractor", logger_,
      [this, &forest] { return components_.schemas->Extract(forest); });
  auto endpoints = LaunchExtractor<ApiEndpoints>(
      "api_discovery", logger_, [this, &forest, &chunks] {
        return components_.endpoints->Discover(forest, chunks);
      });

  result.call_graph = call_graph.get();
  result.dependency_graph = dependencies.get();
  result.schema_map = schemas.get();
  result.api_endpoints = endpoints.get();

  logger_->Log(LogLevel::kInfo, "static.complete",
               {{"entities", std::to_string(forest.entities.size())},
                {"call_edges", std::to_string(result.call_graph.edges.size())},
                {"imports",
                 std::to_string(result.dependency_graph.imports.size())},
                {"schemas", std::to_string(result.schema_map.schemas.size())},
                {"endpoints",
                 std::to_string(result.api_endpoints.endpoints.size())}});
  return result;
}

} // namespace scribe
