#include <scribe/confidence_scorer.h>

#include <algorithm>

namespace scribe {

ConfidenceScore ScoreFinding(const std::string &finding, bool ast_source,
                             bool llm_source, Agreement agreement) {
  const auto quoted = "'" + finding + "'";
  if (ast_source && llm_source) {
    switch (agreement) {
    case Agreement::kHigh:
      return {confidence::kCrossValidatedHigh, AnalysisSource::kCrossValidated,
              "Cross-validated: AST and LLM agree on " + quoted};
    case Agreement::kMedium:
      return {confidence::kCrossValidatedMedium,
              AnalysisSource::kCrossValidated,
              "Partial agreement on " + quoted};
    case Agreement::kLow:
      return {confidence::kCrossValidatedLow, AnalysisSource::kCrossValidated,
              "AST and LLM disagree on " + quoted};
    }
  }
  if (ast_source) {
    return {confidence::kAstOnly, AnalysisSource::kAst,
            "AST-derived (deterministic): " + quoted};
  }
  return {confidence::kLlmOnly, AnalysisSource::kLlm,
          "LLM-inferred (probabilistic): " + quoted};
}

double ConfidenceFromLevel(const std::string &level) {
  if (level == "high") {
    return 0.9;
  }
  if (level == "medium") {
    return 0.7;
  }
  return 0.5;
}

double ClampConfidence(double value) {
  return std::clamp(value, confidence::kFloor, confidence::kCeiling);
}

} // namespace scribe
