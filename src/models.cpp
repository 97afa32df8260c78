#include <scribe/models.h>

namespace scribe {

std::string ToString(StageProgress status) {
  switch (status) {
  case StageProgress::kRunning:
    return "running";
  case StageProgress::kDone:
    return "done";
  case StageProgress::kError:
    return "error";
  }
  return "unknown";
}

std::string ToString(AnalysisSource source) {
  switch (source) {
  case AnalysisSource::kAst:
    return "ast";
  case AnalysisSource::kLlm:
    return "llm";
  case AnalysisSource::kCrossValidated:
    return "cross_validated";
  }
  return "unknown";
}

std::vector<std::string> RunResult::SucceededStages() const {
  std::vector<std::string> names;
  for (const auto &stage : stages) {
    if (stage.ok) {
      names.push_back(stage.name);
    }
  }
  return names;
}

std::vector<std::string> RunResult::FailedStages() const {
  std::vector<std::string> names;
  for (const auto &stage : stages) {
    if (!stage.ok) {
      names.push_back(stage.name);
    }
  }
  return names;
}

} // namespace scribe
