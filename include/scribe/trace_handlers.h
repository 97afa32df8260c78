#pragma once

#include <scribe/logging.h>
#include <scribe/trace_dispatcher.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace scribe {

// Writes every trace event to the logger.
class ConsoleTraceHandler : public TraceHandler {
public:
  explicit ConsoleTraceHandler(std::shared_ptr<Logger> logger,
                               LogLevel level = LogLevel::kInfo);
  std::string Name() const override { return "console"; }
  void Handle(const TraceEvent &event) override;

private:
  std::shared_ptr<Logger> logger_;
  LogLevel level_;
};

struct TraceCost {
  std::int64_t input_tokens = 0;
  std::int64_t output_tokens = 0;
  double total_cost = 0.0;
  int call_count = 0;
};

// Sums token usage and cost of llm_call events per trace id.
class CostAggregatorHandler : public TraceHandler {
public:
  std::string Name() const override { return "cost_aggregator"; }
  void Handle(const TraceEvent &event) override;

  TraceCost CostFor(const std::string &trace_id) const;
  std::map<std::string, TraceCost> AllCosts() const;
  void Clear();

private:
  mutable std::mutex mutex_;
  std::map<std::string, TraceCost> costs_;
};

} // namespace scribe
