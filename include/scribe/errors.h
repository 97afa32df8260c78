#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace scribe {

// Failure reported by a model client. The status code is present when the
// remote side answered with one.
class ModelCallError : public std::runtime_error {
public:
  explicit ModelCallError(const std::string &message,
                          std::optional<int> status_code = std::nullopt);
  std::optional<int> StatusCode() const noexcept { return status_code_; }

private:
  std::optional<int> status_code_;
};

class CallTimeoutError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CircuitOpenError : public std::runtime_error {
public:
  explicit CircuitOpenError(const std::string &model);
  const std::string &Model() const noexcept { return model_; }

private:
  std::string model_;
};

// Raised when a run is cancelled. Never treated as a stage failure.
class CancelledError : public std::runtime_error {
public:
  CancelledError();
  explicit CancelledError(const std::string &message);
};

enum class ErrorClass { kTransient, kClient, kServer, kTimeout, kUnknown };

std::string ToString(ErrorClass error_class);

ErrorClass ClassifyError(const std::exception &error);
bool IsRetryable(ErrorClass error_class);
bool IsRetryable(const std::exception &error);
// 429 or a rate limit message. Only these are retried in place.
bool IsRateLimited(const std::exception &error);

} // namespace scribe
