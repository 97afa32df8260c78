#include <scribe/trace_handlers.h>

#include <utility>

namespace scribe {
namespace {

std::int64_t IntegerField(const TraceData &data, const std::string &key) {
  const auto found = data.find(key);
  if (found == data.end()) {
    return 0;
  }
  if (const auto *integer = std::get_if<std::int64_t>(&found->second)) {
    return *integer;
  }
  if (const auto *number = std::get_if<double>(&found->second)) {
    return static_cast<std::int64_t>(*number);
  }
  return 0;
}

double NumberField(const TraceData &data, const std::string &key) {
  const auto found = data.find(key);
  if (found == data.end()) {
    return 0.0;
  }
  if (const auto *number = std::get_if<double>(&found->second)) {
    return *number;
  }
  if (const auto *integer = std::get_if<std::int64_t>(&found->second)) {
    return static_cast<double>(*integer);
  }
  return 0.0;
}

} // namespace

ConsoleTraceHandler::ConsoleTraceHandler(std::shared_ptr<Logger> logger,
                                         LogLevel level)
    : logger_(EnsureLogger(std::move(logger))), level_(level) {}

void ConsoleTraceHandler::Handle(const TraceEvent &event) {
  if (!logger_->IsEnabled(level_)) {
    return;
  }
  LogFields fields{{"trace_type", ToString(event.type)},
                   {"trace_id", event.trace_id},
                   {"category", ToString(event.category)},
                   {"timestamp", FormatTimestamp(event.timestamp)}};
  for (const auto &[key, value] : event.data) {
    fields.emplace_back(key, FormatTraceValue(value));
  }
  logger_->Log(level_, "trace", std::move(fields));
}

void CostAggregatorHandler::Handle(const TraceEvent &event) {
  if (event.type != TraceEventType::kLlmCall) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto &cost = costs_[event.trace_id];
  cost.input_tokens += IntegerField(event.data, "input_tokens");
  cost.output_tokens += IntegerField(event.data, "output_tokens");
  cost.total_cost += NumberField(event.data, "cost");
  cost.call_count += 1;
}

TraceCost CostAggregatorHandler::CostFor(const std::string &trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = costs_.find(trace_id);
  return found == costs_.end() ? TraceCost{} : found->second;
}

std::map<std::string, TraceCost> CostAggregatorHandler::AllCosts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return costs_;
}

void CostAggregatorHandler::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  costs_.clear();
}

} // namespace scribe
