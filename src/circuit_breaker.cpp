#include <scribe/circuit_breaker.h>

#include <utility>

namespace scribe {

CircuitBreaker::CircuitBreaker(std::string name, BreakerPolicy policy,
                               NowFunction now)
    : name_(std::move(name)), policy_(policy), now_(std::move(now)) {}

bool CircuitBreaker::AllowRequest() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::kOpen) {
    return true;
  }
  if (now_() - opened_at_ >= policy_.recovery_timeout) {
    state_ = State::kHalfOpen;
    return true;
  }
  return false;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard<std::mutex> lock(mutex_);
  consecutive_failures_ = 0;
  state_ = State::kClosed;
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++consecutive_failures_;
  if (state_ == State::kHalfOpen ||
      consecutive_failures_ >= policy_.failure_threshold) {
    state_ = State::kOpen;
    opened_at_ = now_();
  }
}

CircuitBreaker::State CircuitBreaker::CurrentState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string ToString(CircuitBreaker::State state) {
  switch (state) {
  case CircuitBreaker::State::kClosed:
    return "closed";
  case CircuitBreaker::State::kOpen:
    return "open";
  case CircuitBreaker::State::kHalfOpen:
    return "half_open";
  }
  return "unknown";
}

} // namespace scribe
