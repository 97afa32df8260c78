#pragma once

#include <scribe/models.h>

#include <optional>
#include <string>
#include <vector>

namespace scribe {

enum class StreamEventKind { kStage, kComplete, kError, kPaused };

std::string ToString(StreamEventKind kind);

// Wire envelope delivered to progress consumers. `data` is JSON text; stage
// envelopes also keep the structured event for status queries.
struct StreamEnvelope {
  StreamEventKind kind = StreamEventKind::kStage;
  std::string data;
  std::optional<StageEvent> stage;
};

// Human readable label shown next to a stage name.
std::string StageLabel(const std::string &stage_name);

StreamEnvelope MakeStageEnvelope(const StageEvent &event);
StreamEnvelope MakeCompleteEnvelope(const RunResult &result);
StreamEnvelope MakeErrorEnvelope(const std::string &message);
StreamEnvelope MakePausedEnvelope();

// "event: <kind>\ndata: <json>\n\n"
std::string FormatWireEvent(const StreamEnvelope &envelope);

struct StageSnapshot {
  std::string name;
  std::string label;
  StageProgress status = StageProgress::kRunning;
  std::string message;
  double duration_ms = 0.0;
};

// Latest state per stage, in order of first appearance.
std::vector<StageSnapshot>
DeriveStages(const std::vector<StreamEnvelope> &history);

} // namespace scribe
