#include <scribe/trace_dispatcher.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace scribe {

TraceDispatcher::TraceDispatcher(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

bool TraceDispatcher::Register(std::shared_ptr<TraceHandler> handler) {
  if (!handler) {
    return false;
  }
  const auto name = handler->Name();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto duplicate = std::any_of(
      handlers_.begin(), handlers_.end(),
      [&name](const auto &existing) { return existing->Name() == name; });
  if (duplicate) {
    return false;
  }
  handlers_.push_back(std::move(handler));
  return true;
}

void TraceDispatcher::Emit(const TraceEvent &event) const {
  std::vector<std::shared_ptr<TraceHandler>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = handlers_;
  }
  for (const auto &handler : snapshot) {
    try {
      handler->Handle(event);
    } catch (const std::exception &ex) {
      logger_->Log(LogLevel::kWarn, "trace.handler.error",
                   {{"handler", handler->Name()},
                    {"event_type", ToString(event.type)},
                    {"error", ex.what()}});
    }
  }
}

std::size_t TraceDispatcher::HandlerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.size();
}

void EmitPipelineStart(const TraceDispatcher &dispatcher,
                       const std::string &trace_id,
                       const std::string &project_id) {
  dispatcher.Emit(MakeTraceEvent(TraceEventType::kPipelineStart, trace_id,
                                 TraceCategory::kPipeline,
                                 {{"project_id", project_id}}));
}

void EmitPipelineEnd(const TraceDispatcher &dispatcher,
                     const std::string &trace_id, double duration_ms,
                     bool success) {
  dispatcher.Emit(MakeTraceEvent(
      TraceEventType::kPipelineEnd, trace_id, TraceCategory::kPipeline,
      {{"duration_ms", duration_ms}, {"success", success}}));
}

void EmitPhaseStart(const TraceDispatcher &dispatcher,
                    const std::string &trace_id, const std::string &phase) {
  dispatcher.Emit(MakeTraceEvent(TraceEventType::kPhaseStart, trace_id,
                                 TraceCategory::kPipeline,
                                 {{"phase", phase}}));
}

void EmitPhaseEnd(const TraceDispatcher &dispatcher,
                  const std::string &trace_id, const std::string &phase,
                  double duration_ms) {
  dispatcher.Emit(MakeTraceEvent(
      TraceEventType::kPhaseEnd, trace_id, TraceCategory::kPipeline,
      {{"phase", phase}, {"duration_ms", duration_ms}}));
}

void EmitStageStart(const TraceDispatcher &dispatcher,
                    const std::string &trace_id, const std::string &stage) {
  dispatcher.Emit(MakeTraceEvent(TraceEventType::kStageStart, trace_id,
                                 TraceCategory::kAnalysis,
                                 {{"stage", stage}}));
}

void EmitStageEnd(const TraceDispatcher &dispatcher,
                  const std::string &trace_id, const std::string &stage,
                  double duration_ms, bool ok,
                  const std::optional<std::string> &error) {
  TraceData data{{"stage", stage}, {"duration_ms", duration_ms}, {"ok", ok}};
  data["error"] = error ? TraceValue(*error) : TraceValue(std::monostate{});
  dispatcher.Emit(MakeTraceEvent(TraceEventType::kStageEnd, trace_id,
                                 TraceCategory::kAnalysis, std::move(data)));
}

void EmitLlmCall(const TraceDispatcher &dispatcher,
                 const std::string &trace_id, const std::string &model,
                 std::int64_t input_tokens, std::int64_t output_tokens,
                 double duration_ms, double cost) {
  dispatcher.Emit(MakeTraceEvent(TraceEventType::kLlmCall, trace_id,
                                 TraceCategory::kLlm,
                                 {{"model", model},
                                  {"input_tokens", input_tokens},
                                  {"output_tokens", output_tokens},
                                  {"duration_ms", duration_ms},
                                  {"cost", cost}}));
}

void EmitError(const TraceDispatcher &dispatcher, const std::string &trace_id,
               const std::string &component, const std::string &message) {
  dispatcher.Emit(MakeTraceEvent(TraceEventType::kError, trace_id,
                                 TraceCategory::kPipeline,
                                 {{"component", component},
                                  {"message", message}}));
}

} // namespace scribe
