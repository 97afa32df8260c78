#pragma once

#include <scribe/models.h>

#include <string>

namespace scribe {

// Joins the validated findings with the structural results into the model
// that documentation sections are generated from. Entities are ordered by
// confidence, then file and line.
IntelligenceModel BuildIntelligenceModel(const std::string &project_id,
                                         const LanguageMap &languages,
                                         const StaticAnalysisResult &static_result,
                                         const LlmAnalysisResult &llm_result,
                                         const ValidationResult &validation);

} // namespace scribe
