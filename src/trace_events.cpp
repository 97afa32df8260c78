#include <scribe/trace_events.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace scribe {

std::string ToString(TraceEventType type) {
  switch (type) {
  case TraceEventType::kPipelineStart:
    return "pipeline_start";
  case TraceEventType::kPipelineEnd:
    return "pipeline_end";
  case TraceEventType::kPhaseStart:
    return "phase_start";
  case TraceEventType::kPhaseEnd:
    return "phase_end";
  case TraceEventType::kStageStart:
    return "stage_start";
  case TraceEventType::kStageEnd:
    return "stage_end";
  case TraceEventType::kLlmCall:
    return "llm_call";
  case TraceEventType::kError:
    return "error";
  }
  return "unknown";
}

std::string ToString(TraceCategory category) {
  switch (category) {
  case TraceCategory::kPipeline:
    return "pipeline";
  case TraceCategory::kAnalysis:
    return "analysis";
  case TraceCategory::kLlm:
    return "llm";
  case TraceCategory::kQuality:
    return "quality";
  case TraceCategory::kGeneration:
    return "generation";
  }
  return "unknown";
}

std::string FormatTraceValue(const TraceValue &value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return "null";
  }
  if (const auto *text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (const auto *number = std::get_if<double>(&value)) {
    std::ostringstream stream;
    stream << *number;
    return stream.str();
  }
  if (const auto *integer = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*integer);
  }
  return std::get<bool>(value) ? "true" : "false";
}

std::string FormatTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto time = std::chrono::system_clock::to_time_t(timestamp);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp.time_since_epoch()) %
                      1000;
  std::tm tm;
#ifdef _WIN32
  gmtime_s(&tm, &time);
#else
  gmtime_r(&time, &tm);
#endif
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
         << std::setfill('0') << millis.count() << "Z";
  return stream.str();
}

TraceEvent MakeTraceEvent(TraceEventType type, std::string trace_id,
                          TraceCategory category, TraceData data) {
  return TraceEvent{type, std::move(trace_id),
                    std::chrono::system_clock::now(), category,
                    std::move(data)};
}

} // namespace scribe
