#pragma once

#include <scribe/models.h>

#include <string>

namespace scribe {

enum class Agreement { kHigh, kMedium, kLow };

namespace confidence {
inline constexpr double kCrossValidatedHigh = 0.95;
inline constexpr double kAstOnly = 0.90;
inline constexpr double kCrossValidatedMedium = 0.85;
inline constexpr double kLlmOnly = 0.70;
inline constexpr double kCrossValidatedLow = 0.50;
inline constexpr double kFloor = 0.10;
inline constexpr double kCeiling = 0.95;
} // namespace confidence

// Merges a deterministic (AST) and a probabilistic (LLM) view of the same
// finding into one score. A finding seen by neither source is scored as
// LLM-only.
ConfidenceScore ScoreFinding(const std::string &finding, bool ast_source,
                             bool llm_source,
                             Agreement agreement = Agreement::kHigh);

// "high" -> 0.9, "medium" -> 0.7, anything else -> 0.5.
double ConfidenceFromLevel(const std::string &level);

double ClampConfidence(double value);

} // namespace scribe
