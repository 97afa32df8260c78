#include <scribe/intelligence_model.h>

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace scribe {

IntelligenceModel BuildIntelligenceModel(const std::string &project_id,
                                         const LanguageMap &languages,
                                         const StaticAnalysisResult &static_result,
                                         const LlmAnalysisResult &llm_result,
                                         const ValidationResult &validation) {
  if (project_id.empty()) {
    throw std::invalid_argument("Intelligence model requires a project id.");
  }

  IntelligenceModel model;
  model.project_id = project_id;
  model.entities = validation.entities;
  std::stable_sort(model.entities.begin(), model.entities.end(),
                   [](const ValidatedEntity &left, const ValidatedEntity &right) {
                     return std::make_tuple(-left.confidence.value,
                                            left.file_path, left.line_start) <
                            std::make_tuple(-right.confidence.value,
                                            right.file_path, right.line_start);
                   });
  model.call_graph = static_result.call_graph;
  model.dependency_graph = static_result.dependency_graph;
  model.schema_map = static_result.schema_map;
  model.api_endpoints = static_result.api_endpoints;
  model.narratives = llm_result.narratives;
  model.language_counts = languages.language_counts;
  return model;
}

} // namespace scribe
