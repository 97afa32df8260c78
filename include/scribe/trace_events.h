#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace scribe {

enum class TraceEventType {
  kPipelineStart,
  kPipelineEnd,
  kPhaseStart,
  kPhaseEnd,
  kStageStart,
  kStageEnd,
  kLlmCall,
  kError
};

enum class TraceCategory { kPipeline, kAnalysis, kLlm, kQuality, kGeneration };

using TraceValue =
    std::variant<std::monostate, std::string, double, std::int64_t, bool>;
using TraceData = std::map<std::string, TraceValue>;

// Immutable observability record. Many events share one trace id.
struct TraceEvent {
  TraceEventType type = TraceEventType::kPipelineStart;
  std::string trace_id;
  std::chrono::system_clock::time_point timestamp;
  TraceCategory category = TraceCategory::kPipeline;
  TraceData data;
};

std::string ToString(TraceEventType type);
std::string ToString(TraceCategory category);
std::string FormatTraceValue(const TraceValue &value);
// ISO 8601 in UTC with millisecond precision.
std::string FormatTimestamp(std::chrono::system_clock::time_point timestamp);

TraceEvent MakeTraceEvent(TraceEventType type, std::string trace_id,
                          TraceCategory category, TraceData data = {});

} // namespace scribe
