#include <scribe/section_generator.h>

#include <scribe/confidence_scorer.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace scribe {
namespace {

constexpr std::size_t kMaxListed = 25;
constexpr double kTemplateConfidence = 0.50;

// Facts a section is written from: a markdown rendering that doubles as the
// model prompt, plus the citations backing it.
struct SectionDraft {
  std::string markdown;
  std::vector<Citation> citations;
};

Citation CiteEntity(const ValidatedEntity &entity) {
  return Citation{entity.file_path, entity.name, entity.line_start,
                  std::max(entity.line_start, entity.line_end),
                  entity.confidence.value};
}

void AppendEntityCitations(const IntelligenceModel &model,
                           const std::function<bool(const ValidatedEntity &)>
                               &wanted,
                           std::size_t limit, SectionDraft &draft) {
  for (const auto &entity : model.entities) {
    if (draft.citations.size() >= limit) {
      break;
    }
    if (entity.kind != "behavior" && wanted(entity)) {
      draft.citations.push_back(CiteEntity(entity));
    }
  }
}

SectionDraft DraftExecutiveOverview(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  out << "Project `" << model.project_id << "` contains "
      << model.entities.size() << " documented entities";
  if (!model.language_counts.empty()) {
    out << " across";
    bool first = true;
    for (const auto &[language, count] : model.language_counts) {
      out << (first ? " " : ", ") << count << " " << language << " files";
      first = false;
    }
  }
  out << ".\n\n";
  if (!model.api_endpoints.endpoints.empty()) {
    out << "It exposes " << model.api_endpoints.endpoints.size()
        << " HTTP endpoints.\n\n";
  }
  if (!model.narratives.empty()) {
    out << "Highlights:\n\n";
    for (std::size_t i = 0; i < model.narratives.size() && i < 5; ++i) {
      out << "- " << model.narratives[i].summary << "\n";
    }
  }
  draft.markdown = out.str();
  AppendEntityCitations(
      model, [](const ValidatedEntity &) { return true; }, 5, draft);
  return draft;
}

SectionDraft DraftSystemOverview(const IntelligenceModel &model) {
  SectionDraft draft;
  std::map<std::string, int> modules;
  for (const auto &entity : model.entities) {
    const auto slash = entity.file_path.rfind('/');
    modules[slash == std::string::npos ? "." : entity.file_path.substr(0, slash)]++;
  }
  std::map<std::string, int> fan_out;
  for (const auto &edge : model.call_graph.edges) {
    fan_out[edge.caller]++;
  }

  std::ostringstream out;
  out << "## Modules\n\n";
  for (const auto &[module, count] : modules) {
    out << "- `" << module << "`: " << count << " entities\n";
  }
  out << "\n## Dependencies\n\n" << model.dependency_graph.imports.size()
      << " import statements, " << model.call_graph.edges.size()
      << " call edges.\n";
  if (!fan_out.empty()) {
    std::vector<std::pair<std::string, int>> callers(fan_out.begin(),
                                                     fan_out.end());
    std::stable_sort(callers.begin(), callers.end(),
                     [](const auto &left, const auto &right) {
                       return left.second > right.second;
                     });
    out << "\nMost connected functions:\n\n";
    for (std::size_t i = 0; i < callers.size() && i < 5; ++i) {
      out << "- `" << callers[i].first << "` calls " << callers[i].second
          << " functions\n";
    }
  }
  draft.markdown = out.str();
  AppendEntityCitations(
      model,
      [&fan_out](const ValidatedEntity &entity) {
        return fan_out.count(entity.name) > 0;
      },
      10, draft);
  return draft;
}

SectionDraft DraftDataModels(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  if (model.schema_map.schemas.empty()) {
    out << "No record types with fields were found.\n";
  }
  for (std::size_t i = 0;
       i < model.schema_map.schemas.size() && i < kMaxListed; ++i) {
    const auto &schema = model.schema_map.schemas[i];
    out << "## " << schema.name << "\n\n| Field | Type |\n| --- | --- |\n";
    for (const auto &[field, type] : schema.fields) {
      out << "| " << field << " | `" << type << "` |\n";
    }
    out << "\n";
    draft.citations.push_back(Citation{schema.file_path, schema.name,
                                       schema.line_start,
                                       std::max(schema.line_start,
                                                schema.line_end),
                                       confidence::kAstOnly});
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftApiSpecs(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  if (model.api_endpoints.endpoints.empty()) {
    out << "No HTTP endpoints were found.\n";
  } else {
    out << "| Method | Path | Location |\n| --- | --- | --- |\n";
  }
  for (std::size_t i = 0;
       i < model.api_endpoints.endpoints.size() && i < kMaxListed; ++i) {
    const auto &endpoint = model.api_endpoints.endpoints[i];
    out << "| " << endpoint.method << " | `" << endpoint.path << "` | "
        << endpoint.file_path << ":" << endpoint.line << " |\n";
    draft.citations.push_back(Citation{endpoint.file_path, std::nullopt,
                                       endpoint.line, endpoint.line,
                                       confidence::kAstOnly});
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftFeatures(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  if (model.narratives.empty()) {
    out << "No behavioral analysis is available.\n";
  }
  for (std::size_t i = 0; i < model.narratives.size() && i < kMaxListed; ++i) {
    const auto &narrative = model.narratives[i];
    out << "### " << narrative.file_path << ":" << narrative.start_line
        << "\n\n" << narrative.summary << "\n";
    for (const auto &behavior : narrative.behaviors) {
      out << "- " << behavior << "\n";
    }
    out << "\n";
    draft.citations.push_back(Citation{narrative.file_path, std::nullopt,
                                       narrative.start_line,
                                       narrative.end_line,
                                       confidence::kLlmOnly});
  }
  draft.markdown = out.str();
  return draft;
}

bool NameHasAny(const std::string &name,
                const std::vector<std::string> &keywords) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::any_of(keywords.begin(), keywords.end(),
                     [&lower](const std::string &keyword) {
                       return lower.find(keyword) != std::string::npos;
                     });
}

std::vector<const ValidatedEntity *>
EntitiesNamed(const IntelligenceModel &model,
              const std::vector<std::string> &keywords) {
  std::vector<const ValidatedEntity *> found;
  for (const auto &entity : model.entities) {
    if (entity.kind != "behavior" && NameHasAny(entity.name, keywords)) {
      found.push_back(&entity);
    }
  }
  return found;
}

// Writes an Entity | Kind | Location table and cites every row.
void AppendEntityTable(const std::vector<const ValidatedEntity *> &entities,
                       std::ostringstream &out, SectionDraft &draft) {
  out << "| Entity | Kind | Location |\n| --- | --- | --- |\n";
  for (std::size_t i = 0; i < entities.size() && i < kMaxListed; ++i) {
    const auto &entity = *entities[i];
    out << "| `" << entity.name << "` | " << entity.kind << " | `"
        << entity.file_path << ":" << entity.line_start << "` |\n";
    draft.citations.push_back(CiteEntity(entity));
  }
  out << "\n";
}

SectionDraft DraftPersonas(const IntelligenceModel &model) {
  static const std::vector<std::pair<std::string, std::vector<std::string>>>
      kPersonas = {
          {"Administrator", {"admin", "manage", "dashboard", "config", "setting"}},
          {"Developer", {"api", "sdk", "webhook", "endpoint", "token"}},
          {"End User", {"login", "register", "profile", "account", "submit"}},
      };
  SectionDraft draft;
  std::ostringstream out;
  bool any = false;
  for (const auto &[persona, keywords] : kPersonas) {
    const auto related = EntitiesNamed(model, keywords);
    if (related.empty()) {
      continue;
    }
    any = true;
    out << "## " << persona << "\n\n### System Interactions\n\n";
    for (std::size_t i = 0; i < related.size() && i < 10; ++i) {
      out << "- `" << related[i]->name << "`\n";
      draft.citations.push_back(CiteEntity(*related[i]));
    }
    out << "\n";
  }
  if (!any) {
    out << "## General User\n\nNo role-specific entry points were found.\n";
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftUserStories(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  std::size_t written = 0;
  for (const auto &narrative : model.narratives) {
    const auto before = written;
    for (const auto &behavior : narrative.behaviors) {
      if (written == kMaxListed) {
        break;
      }
      out << "- **As a** user, **I want** the system to " << behavior
          << ", **so that** `" << narrative.file_path
          << "` behaves as described.\n";
      ++written;
    }
    if (written > before) {
      draft.citations.push_back(Citation{narrative.file_path, std::nullopt,
                                         narrative.start_line,
                                         narrative.end_line,
                                         confidence::kLlmOnly});
    }
  }
  if (written == 0) {
    out << "No observed behaviors to write user stories from.\n";
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftSecurityRequirements(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  const auto authentication = EntitiesNamed(
      model, {"auth", "login", "logout", "token", "jwt", "oauth", "session",
              "password", "credential"});
  const auto authorization = EntitiesNamed(
      model, {"permission", "role", "rbac", "scope", "access", "policy",
              "guard", "middleware"});
  if (!authentication.empty()) {
    out << "## Authentication\n\n";
    AppendEntityTable(authentication, out, draft);
  }
  if (!authorization.empty()) {
    out << "## Authorization\n\n";
    AppendEntityTable(authorization, out, draft);
  }
  if (authentication.empty() && authorization.empty()) {
    out << "No authentication or authorization code was found.\n";
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftInterfaces(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  std::vector<const ValidatedEntity *> boundaries;
  for (const auto &entity : model.entities) {
    if (entity.kind == "type" &&
        NameHasAny(entity.name, {"interface", "service", "repository",
                                 "handler", "controller", "client"})) {
      boundaries.push_back(&entity);
    }
  }
  std::stable_sort(boundaries.begin(), boundaries.end(),
                   [](const ValidatedEntity *left,
                      const ValidatedEntity *right) {
                     return left->name < right->name;
                   });
  if (boundaries.empty()) {
    out << "No service boundaries were found.\n";
  } else {
    out << "## Service Boundaries\n\n";
    AppendEntityTable(boundaries, out, draft);
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftUiSpecs(const IntelligenceModel &model) {
  static const std::vector<std::string> kUiKeywords = {
      "component", "page",   "view",  "screen",   "form",     "modal",
      "dialog",    "button", "input", "layout",   "template", "widget"};
  static const std::vector<std::string> kUiExtensions = {".tsx", ".jsx",
                                                         ".vue", ".svelte"};
  SectionDraft draft;
  std::ostringstream out;
  std::vector<const ValidatedEntity *> screens;
  for (const auto &entity : model.entities) {
    if (entity.kind != "behavior" &&
        (NameHasAny(entity.name, kUiKeywords) ||
         NameHasAny(entity.file_path, kUiExtensions))) {
      screens.push_back(&entity);
    }
  }
  if (screens.empty()) {
    out << "No UI components were found.\n";
  } else {
    out << "## Screens and Components\n\n";
    AppendEntityTable(screens, out, draft);
    out << "**" << screens.size() << "** UI components identified.\n";
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftIntegrations(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  std::map<std::string, std::vector<std::string>> importers;
  for (const auto &edge : model.dependency_graph.imports) {
    auto &sources = importers[edge.target];
    if (std::find(sources.begin(), sources.end(), edge.source_file) ==
        sources.end()) {
      sources.push_back(edge.source_file);
    }
  }
  if (importers.empty()) {
    out << "No integration points were found.\n";
    draft.markdown = out.str();
    return draft;
  }
  std::vector<std::pair<std::string, std::vector<std::string>>> modules(
      importers.begin(), importers.end());
  std::stable_sort(modules.begin(), modules.end(),
                   [](const auto &left, const auto &right) {
                     return left.second.size() > right.second.size();
                   });
  out << "## External Dependencies\n\n| Module | Importers | Used By |\n"
         "| --- | --- | --- |\n";
  for (std::size_t i = 0; i < modules.size() && i < kMaxListed; ++i) {
    const auto &[target, sources] = modules[i];
    out << "| `" << target << "` | " << sources.size() << " | ";
    for (std::size_t j = 0; j < sources.size() && j < 3; ++j) {
      out << (j == 0 ? "" : ", ") << "`" << sources[j] << "`";
    }
    out << (sources.size() > 3 ? "..." : "") << " |\n";
  }
  for (const auto &edge : model.dependency_graph.imports) {
    if (draft.citations.size() >= kMaxListed) {
      break;
    }
    draft.citations.push_back(Citation{edge.source_file, std::nullopt,
                                       edge.line, edge.line,
                                       confidence::kAstOnly});
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftTechStories(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  const auto &edges = model.call_graph.edges;
  if (edges.empty()) {
    out << "No call chains to write technical stories from.\n";
  } else {
    out << "## From Call Chains\n\n";
  }
  for (std::size_t i = 0; i < edges.size() && i < 15; ++i) {
    out << "- **As a** developer, **I need** `" << edges[i].caller
        << "` to call `" << edges[i].callee
        << "`, **so that** the call chain is maintained.\n";
    draft.citations.push_back(Citation{edges[i].file_path, edges[i].caller,
                                       edges[i].line, edges[i].line,
                                       confidence::kAstOnly});
  }
  draft.markdown = out.str();
  return draft;
}

SectionDraft DraftSecurityConsiderations(const IntelligenceModel &model) {
  SectionDraft draft;
  std::ostringstream out;
  const auto risky = EntitiesNamed(
      model, {"eval", "exec", "system", "popen", "subprocess", "shell",
              "pickle", "deserialize", "unsafe", "raw_sql", "sql", "inject"});
  const auto sensitive = EntitiesNamed(
      model, {"password", "secret", "key", "token", "credential", "private"});
  if (!risky.empty()) {
    out << "## Potential Vulnerability Patterns\n\n";
    AppendEntityTable(risky, out, draft);
  }
  if (!sensitive.empty()) {
    out << "## Sensitive Data Handlers\n\n";
    AppendEntityTable(sensitive, out, draft);
  }
  const bool has_authentication =
      !EntitiesNamed(model, {"auth", "login", "session"}).empty();
  out << "## Coverage Summary\n\n"
      << "- Authentication entities: "
      << (has_authentication ? "Found" : "Not found") << "\n"
      << "- Sensitive data handlers: " << sensitive.size() << " found\n"
      << "- Potential vulnerability patterns: " << risky.size()
      << " found\n";
  draft.markdown = out.str();
  return draft;
}

using Drafter = SectionDraft (*)(const IntelligenceModel &);

const std::map<std::string, Drafter> &Drafters() {
  static const std::map<std::string, Drafter> drafters = {
      {"executive_overview", &DraftExecutiveOverview},
      {"features", &DraftFeatures},
      {"personas", &DraftPersonas},
      {"user_stories", &DraftUserStories},
      {"security_requirements", &DraftSecurityRequirements},
      {"system_overview", &DraftSystemOverview},
      {"data_models", &DraftDataModels},
      {"interfaces", &DraftInterfaces},
      {"ui_specs", &DraftUiSpecs},
      {"api_specs", &DraftApiSpecs},
      {"integrations", &DraftIntegrations},
      {"tech_stories", &DraftTechStories},
      {"security_considerations", &DraftSecurityConsiderations},
  };
  return drafters;
}

double MeanConfidence(const std::vector<Citation> &citations) {
  if (citations.empty()) {
    return confidence::kLlmOnly;
  }
  const auto sum = std::accumulate(
      citations.begin(), citations.end(), 0.0,
      [](double total, const Citation &citation) {
        return total + citation.confidence;
      });
  return sum / static_cast<double>(citations.size());
}

} // namespace

const std::vector<SectionSpec> &SectionCatalog() {
  static const std::vector<SectionSpec> catalog = {
      {"executive_overview", "Executive Overview"},
      {"features", "Features"},
      {"personas", "User Personas"},
      {"user_stories", "User Stories"},
      {"security_requirements", "Security Requirements"},
      {"system_overview", "System Overview"},
      {"data_models", "Data Models"},
      {"interfaces", "Interface Specifications"},
      {"ui_specs", "UI Specifications"},
      {"api_specs", "API Specifications"},
      {"integrations", "Integration Points"},
      {"tech_stories", "Technical User Stories"},
      {"security_considerations", "Security Considerations"},
  };
  return catalog;
}

std::vector<std::string> DefaultSectionNames() {
  std::vector<std::string> names;
  for (const auto &spec : SectionCatalog()) {
    names.push_back(spec.name);
  }
  return names;
}

SynthesizingSectionGenerator::SynthesizingSectionGenerator(
    std::shared_ptr<ResilientCaller> caller,
    std::vector<std::string> model_chain, std::chrono::seconds timeout,
    std::shared_ptr<Logger> logger)
    : caller_(std::move(caller)), model_chain_(std::move(model_chain)),
      timeout_(timeout), logger_(EnsureLogger(std::move(logger))) {}

std::vector<std::string> SynthesizingSectionGenerator::SupportedSections() const {
  return DefaultSectionNames();
}

SectionOutput
SynthesizingSectionGenerator::Generate(const std::string &section_name,
                                       const IntelligenceModel &model) {
  const auto &catalog = SectionCatalog();
  const auto spec = std::find_if(
      catalog.begin(), catalog.end(),
      [&section_name](const SectionSpec &entry) {
        return entry.name == section_name;
      });
  if (spec == catalog.end()) {
    throw std::invalid_argument("Unknown section: " + section_name);
  }
  auto draft = Drafters().at(section_name)(model);

  SectionOutput output;
  output.section_name = section_name;
  output.title = spec->title;
  output.citations = std::move(draft.citations);

  if (caller_ && !model_chain_.empty()) {
    ModelRequest request;
    request.timeout = timeout_;
    request.min_content_length = 20;
    request.messages = {
        {"system", "You write the \"" + spec->title +
                       "\" section of a codebase's documentation in "
                       "markdown. Only state what the facts support."},
        {"user", "Facts:\n\n" + draft.markdown}};
    if (auto response = caller_->CallWithFallback(model_chain_, request,
                                                  model.project_id)) {
      output.content = std::move(response->content);
      output.confidence = ClampConfidence(MeanConfidence(output.citations));
      return output;
    }
    logger_->Log(LogLevel::kWarn, "section.synthesis.fallback",
                 {{"section", section_name}});
  }

  output.content = "# " + spec->title + "\n\n" + draft.markdown;
  output.confidence = kTemplateConfidence;
  return output;
}

} // namespace scribe
