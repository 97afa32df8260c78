#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace scribe {

struct BreakerPolicy {
  int failure_threshold = 5;
  std::chrono::milliseconds recovery_timeout{30000};
};

// Per-model breaker. Opens after `failure_threshold` consecutive failures
// and lets one trial call through once `recovery_timeout` has elapsed.
class CircuitBreaker {
public:
  enum class State { kClosed, kOpen, kHalfOpen };
  using Clock = std::chrono::steady_clock;
  using NowFunction = std::function<Clock::time_point()>;

  CircuitBreaker(std::string name, BreakerPolicy policy,
                 NowFunction now = Clock::now);

  bool AllowRequest();
  void RecordSuccess();
  void RecordFailure();
  State CurrentState() const;
  const std::string &Name() const { return name_; }

private:
  std::string name_;
  BreakerPolicy policy_;
  NowFunction now_;
  mutable std::mutex mutex_;
  State state_ = State::kClosed;
  int consecutive_failures_ = 0;
  Clock::time_point opened_at_{};
};

std::string ToString(CircuitBreaker::State state);

} // namespace scribe
