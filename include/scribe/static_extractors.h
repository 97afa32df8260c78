#pragma once

#include <scribe/interfaces.h>

namespace scribe {

// Call edges between entities, deduplicated.
class AstCallGraphBuilder : public CallGraphBuilder {
public:
  CallGraph Build(const AstForest &forest) override;
};

// #include, import and require statements found in source chunks.
class SourceDependencyExtractor : public DependencyExtractor {
public:
  DependencyGraph Extract(const AstForest &forest,
                          const ChunkedFiles &chunks) override;
};

// Record types with their fields.
class AstSchemaExtractor : public SchemaExtractor {
public:
  SchemaMap Extract(const AstForest &forest) override;
};

// HTTP route registrations in common web frameworks.
class RouteEndpointDiscoverer : public EndpointDiscoverer {
public:
  ApiEndpoints Discover(const AstForest &forest,
                        const ChunkedFiles &chunks) override;
};

} // namespace scribe
