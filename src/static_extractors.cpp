#include <scribe/static_extractors.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <tuple>

namespace scribe {
namespace {

template <typename Visitor>
void ForEachLine(const CodeChunk &chunk, Visitor visitor) {
  std::istringstream stream(chunk.content);
  std::string line;
  int line_number = chunk.start_line;
  while (std::getline(stream, line)) {
    visitor(line, line_number);
    ++line_number;
  }
}

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::toupper(character));
                 });
  return value;
}

struct RoutePattern {
  std::regex expression;
  // Submatch index of the method, or 0 when `fixed_method` applies.
  int method_group;
  int path_group;
  const char *fixed_method;
};

const std::vector<RoutePattern> &RoutePatterns() {
  static const std::vector<RoutePattern> patterns = {
      // @app.get("/users") / @router.post('/items')
      {std::regex(R"(@\w+\.(get|post|put|patch|delete)\(\s*["']([^"']+)["'])",
                  std::regex::icase),
       1, 2, nullptr},
      // app.get('/users', ...) in express style servers.
      {std::regex(
           R"(\b(?:app|router|server)\.(get|post|put|patch|delete)\(\s*["'`]([^"'`]+)["'`])",
           std::regex::icase),
       1, 2, nullptr},
      // svr.Get("/users", ...) in cpp-httplib style servers.
      {std::regex(R"(\b\w+\.(Get|Post|Put|Patch|Delete)\(\s*"([^"]+)\")"), 1,
       2, nullptr},
      // @GetMapping("/users") in Spring controllers.
      {std::regex(R"(@(Get|Post|Put|Patch|Delete)Mapping\(\s*"([^"]+)\")"), 1,
       2, nullptr},
      // CROW_ROUTE(app, "/users")
      {std::regex(R"(CROW_ROUTE\(\s*\w+\s*,\s*"([^"]+)\")"), 0, 1, "GET"},
  };
  return patterns;
}

} // namespace

CallGraph AstCallGraphBuilder::Build(const AstForest &forest) {
  CallGraph graph;
  std::set<std::tuple<std::string, std::string, std::string>> seen;
  for (const auto &call : forest.calls) {
    if (call.caller == call.callee) {
      continue;
    }
    if (seen.emplace(call.caller, call.callee, call.file_path).second) {
      graph.edges.push_back(
          {call.caller, call.callee, call.file_path, call.line});
    }
  }
  return graph;
}

DependencyGraph SourceDependencyExtractor::Extract(const AstForest &,
                                                   const ChunkedFiles &chunks) {
  static const std::regex include_pattern(R"(^\s*#\s*include\s*[<"]([^>"]+)[>"])");
  static const std::regex python_from(R"(^\s*from\s+([\w\.]+)\s+import\b)");
  static const std::regex python_import(R"(^\s*import\s+([\w\.]+))");
  static const std::regex js_import(
      R"(^\s*import\s.*?from\s+["']([^"']+)["'])");
  static const std::regex js_require(R"(require\(\s*["']([^"']+)["']\s*\))");
  static const std::regex go_import(R"(^\s*import\s+"([^"]+)\")");

  DependencyGraph graph;
  for (const auto &chunk : chunks.chunks) {
    ForEachLine(chunk, [&](const std::string &line, int line_number) {
      std::smatch match;
      const auto add = [&](const std::string &target) {
        graph.imports.push_back({chunk.file_path, target, line_number});
      };
      if (chunk.language == "c" || chunk.language == "cpp") {
        if (std::regex_search(line, match, include_pattern)) {
          add(match[1]);
        }
      } else if (chunk.language == "python") {
        if (std::regex_search(line, match, python_from) ||
            std::regex_search(line, match, python_import)) {
          add(match[1]);
        }
      } else if (chunk.language == "javascript" ||
                 chunk.language == "typescript") {
        if (std::regex_search(line, match, js_import) ||
            std::regex_search(line, match, js_require)) {
          add(match[1]);
        }
      } else if (chunk.language == "go") {
        if (std::regex_search(line, match, go_import)) {
          add(match[1]);
        }
      }
    });
  }
  return graph;
}

SchemaMap AstSchemaExtractor::Extract(const AstForest &forest) {
  std::map<std::string, std::vector<std::pair<std::string, std::string>>>
      fields_by_owner;
  for (const auto &field : forest.fields) {
    fields_by_owner[field.owner].emplace_back(field.name, field.type);
  }

  SchemaMap schemas;
  for (const auto &entity : forest.entities) {
    if (entity.kind != "type") {
      continue;
    }
    const auto found = fields_by_owner.find(entity.name);
    if (found == fields_by_owner.end()) {
      continue;
    }
    schemas.schemas.push_back({entity.name, entity.file_path,
                               entity.line_start, entity.line_end,
                               found->second});
  }
  return schemas;
}

ApiEndpoints RouteEndpointDiscoverer::Discover(const AstForest &,
                                               const ChunkedFiles &chunks) {
  ApiEndpoints endpoints;
  for (const auto &chunk : chunks.chunks) {
    ForEachLine(chunk, [&](const std::string &line, int line_number) {
      for (const auto &pattern : RoutePatterns()) {
        std::smatch match;
        if (!std::regex_search(line, match, pattern.expression)) {
          continue;
        }
        const auto method = pattern.method_group > 0
                                ? ToUpper(match[pattern.method_group])
                                : std::string(pattern.fixed_method);
        endpoints.endpoints.push_back(
            {method, match[pattern.path_group], chunk.file_path, line_number});
        break;
      }
    });
  }
  return endpoints;
}

} // namespace scribe
