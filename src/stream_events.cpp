#include <scribe/stream_events.h>

#include <scribe/escaping.h>

#include <cmath>
#include <map>
#include <sstream>

namespace scribe {
namespace {

const std::map<std::string, std::string> &StageLabels() {
  static const std::map<std::string, std::string> labels = {
      {"ingestion_resolve", "Scanning codebase"},
      {"ingestion_detect", "Detecting languages"},
      {"ingestion_chunk", "Splitting source files"},
      {"static_analysis", "Parsing code structure"},
      {"llm_analysis", "AI analysis"},
      {"dual_analysis", "Cross-validating findings"},
      {"quality", "Scoring confidence"},
      {"intelligence_model", "Building Intelligence Model"},
      {"section_generation", "Generating documentation"},
      {"citation_verification", "Verifying citations"},
      {"persistence", "Saving results"},
  };
  return labels;
}

std::string FormatNumber(double value) {
  if (!std::isfinite(value)) {
    return "0";
  }
  std::ostringstream stream;
  stream << value;
  return stream.str();
}

class JsonObjectWriter {
public:
  JsonObjectWriter &Add(const std::string &key, const std::string &value) {
    return AddRaw(key, "\"" + EscapeJsonString(value) + "\"");
  }
  JsonObjectWriter &Add(const std::string &key, const char *value) {
    return Add(key, std::string(value));
  }
  JsonObjectWriter &Add(const std::string &key, double value) {
    return AddRaw(key, FormatNumber(value));
  }
  JsonObjectWriter &Add(const std::string &key, int value) {
    return AddRaw(key, std::to_string(value));
  }
  JsonObjectWriter &Add(const std::string &key, bool value) {
    return AddRaw(key, value ? "true" : "false");
  }
  JsonObjectWriter &Add(const std::string &key,
                        const std::vector<std::string> &values) {
    std::string array = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
      if (i > 0) {
        array.append(", ");
      }
      array.append("\"" + EscapeJsonString(values[i]) + "\"");
    }
    array.append("]");
    return AddRaw(key, array);
  }
  JsonObjectWriter &AddRaw(const std::string &key, const std::string &json) {
    if (!body_.empty()) {
      body_.append(", ");
    }
    body_.append("\"" + EscapeJsonString(key) + "\": " + json);
    return *this;
  }
  std::string str() const { return "{" + body_ + "}"; }

private:
  std::string body_;
};

} // namespace

std::string ToString(StreamEventKind kind) {
  switch (kind) {
  case StreamEventKind::kStage:
    return "stage";
  case StreamEventKind::kComplete:
    return "complete";
  case StreamEventKind::kError:
    return "error";
  case StreamEventKind::kPaused:
    return "paused";
  }
  return "unknown";
}

std::string StageLabel(const std::string &stage_name) {
  const auto &labels = StageLabels();
  const auto found = labels.find(stage_name);
  if (found != labels.end()) {
    return found->second;
  }
  const std::string generate_prefix = "generate_";
  if (stage_name.rfind(generate_prefix, 0) == 0) {
    auto section = stage_name.substr(generate_prefix.size());
    for (auto &character : section) {
      if (character == '_') {
        character = ' ';
      }
    }
    return "Generating " + section;
  }
  return stage_name;
}

StreamEnvelope MakeStageEnvelope(const StageEvent &event) {
  JsonObjectWriter writer;
  writer.Add("name", event.name)
      .Add("label", StageLabel(event.name))
      .Add("status", ToString(event.status))
      .Add("message", event.message)
      .Add("duration_ms", std::round(event.duration_ms * 10.0) / 10.0);
  if (event.completed) {
    writer.Add("completed", *event.completed);
  }
  if (event.total) {
    writer.Add("total", *event.total);
  }
  if (event.percent) {
    writer.Add("percent", *event.percent);
  }
  return StreamEnvelope{StreamEventKind::kStage, writer.str(), event};
}

StreamEnvelope MakeCompleteEnvelope(const RunResult &result) {
  JsonObjectWriter writer;
  writer.Add("project_id", result.project_id)
      .Add("sections", static_cast<int>(result.sections.size()))
      .Add("stages_ok", result.SucceededStages())
      .Add("stages_failed", result.FailedStages())
      .Add("partial", result.partial)
      .Add("duration_ms", std::round(result.total_duration_ms));
  return StreamEnvelope{StreamEventKind::kComplete, writer.str(),
                        std::nullopt};
}

StreamEnvelope MakeErrorEnvelope(const std::string &message) {
  JsonObjectWriter writer;
  writer.Add("message", message);
  return StreamEnvelope{StreamEventKind::kError, writer.str(), std::nullopt};
}

StreamEnvelope MakePausedEnvelope() {
  JsonObjectWriter writer;
  writer.Add("message", "Analysis paused");
  return StreamEnvelope{StreamEventKind::kPaused, writer.str(), std::nullopt};
}

std::string FormatWireEvent(const StreamEnvelope &envelope) {
  return "event: " + ToString(envelope.kind) + "\ndata: " + envelope.data +
         "\n\n";
}

std::vector<StageSnapshot>
DeriveStages(const std::vector<StreamEnvelope> &history) {
  std::vector<StageSnapshot> stages;
  std::map<std::string, std::size_t> positions;
  for (const auto &envelope : history) {
    if (envelope.kind != StreamEventKind::kStage || !envelope.stage) {
      continue;
    }
    const auto &event = *envelope.stage;
    StageSnapshot snapshot{event.name, StageLabel(event.name), event.status,
                           event.message, event.duration_ms};
    const auto found = positions.find(event.name);
    if (found == positions.end()) {
      positions.emplace(event.name, stages.size());
      stages.push_back(std::move(snapshot));
    } else {
      stages[found->second] = std::move(snapshot);
    }
  }
  return stages;
}

} // namespace scribe
