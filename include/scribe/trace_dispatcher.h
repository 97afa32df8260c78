#pragma once

#include <scribe/logging.h>
#include <scribe/trace_events.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

class TraceHandler {
public:
  virtual ~TraceHandler() = default;
  virtual std::string Name() const = 0;
  virtual void Handle(const TraceEvent &event) = 0;
};

// Best-effort fan-out of trace events. A handler that throws is logged and
// skipped; the remaining handlers still receive the event.
class TraceDispatcher {
public:
  explicit TraceDispatcher(std::shared_ptr<Logger> logger = nullptr);

  // Returns false when a handler with the same name is already registered.
  bool Register(std::shared_ptr<TraceHandler> handler);
  void Emit(const TraceEvent &event) const;
  std::size_t HandlerCount() const;

private:
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<TraceHandler>> handlers_;
};

void EmitPipelineStart(const TraceDispatcher &dispatcher,
                       const std::string &trace_id,
                       const std::string &project_id);
void EmitPipelineEnd(const TraceDispatcher &dispatcher,
                     const std::string &trace_id, double duration_ms,
                     bool success);
void EmitPhaseStart(const TraceDispatcher &dispatcher,
                    const std::string &trace_id, const std::string &phase);
void EmitPhaseEnd(const TraceDispatcher &dispatcher,
                  const std::string &trace_id, const std::string &phase,
                  double duration_ms);
void EmitStageStart(const TraceDispatcher &dispatcher,
                    const std::string &trace_id, const std::string &stage);
void EmitStageEnd(const TraceDispatcher &dispatcher,
                  const std::string &trace_id, const std::string &stage,
                  double duration_ms, bool ok,
                  const std::optional<std::string> &error);
void EmitLlmCall(const TraceDispatcher &dispatcher,
                 const std::string &trace_id, const std::string &model,
                 std::int64_t input_tokens, std::int64_t output_tokens,
                 double duration_ms, double cost);
void EmitError(const TraceDispatcher &dispatcher, const std::string &trace_id,
               const std::string &component, const std::string &message);

} // namespace scribe
