#pragma once

#include <scribe/circuit_breaker.h>
#include <scribe/logging.h>
#include <scribe/trace_dispatcher.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace scribe {

struct ChatMessage {
  std::string role;
  std::string content;
};

enum class ResponseMode { kText, kJson };

struct ModelResponse {
  std::string content;
  int input_tokens = 0;
  int output_tokens = 0;
  double cost = 0.0;
};

// Outbound model API. Implementations throw ModelCallError (with a status
// code where one is known) or CallTimeoutError.
class ModelClient {
public:
  virtual ~ModelClient() = default;
  virtual ModelResponse Call(const std::string &model,
                             const std::vector<ChatMessage> &messages,
                             std::chrono::seconds timeout,
                             ResponseMode mode) = 0;
};

struct ModelRequest {
  std::vector<ChatMessage> messages;
  std::chrono::seconds timeout{120};
  ResponseMode mode = ResponseMode::kText;
  // Responses shorter than this after fence stripping are rejected.
  std::size_t min_content_length = 1;
};

struct ModelCallResult {
  std::string model;
  std::string content;
  int input_tokens = 0;
  int output_tokens = 0;
};

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_wait{2000};
  std::chrono::milliseconds max_wait{30000};
};

// Removes a surrounding ``` fence (with optional language tag).
std::string StripMarkdownFences(const std::string &content);

class ResilientCaller {
public:
  using SleepFunction = std::function<void(std::chrono::milliseconds)>;

  ResilientCaller(std::shared_ptr<ModelClient> client, RetryPolicy retry,
                  BreakerPolicy breaker,
                  std::shared_ptr<Logger> logger = nullptr,
                  std::shared_ptr<const TraceDispatcher> dispatcher = nullptr,
                  SleepFunction sleep = nullptr);

  // One model behind its breaker. Rate limited calls are retried with
  // exponential backoff; every other failure is rethrown.
  ModelCallResult GuardedCall(const std::string &model,
                              const ModelRequest &request,
                              const std::string &trace_id = "");

  // Walks the chain in order. Returns nullopt once every model failed, was
  // skipped by its breaker or returned unusable content.
  std::optional<ModelCallResult>
  CallWithFallback(const std::vector<std::string> &model_chain,
                   const ModelRequest &request,
                   const std::string &trace_id = "");

  CircuitBreaker &BreakerFor(const std::string &model);
  bool HasClient() const { return client_ != nullptr; }

private:
  std::chrono::milliseconds BackoffFor(int attempt);

  std::shared_ptr<ModelClient> client_;
  RetryPolicy retry_;
  BreakerPolicy breaker_policy_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<const TraceDispatcher> dispatcher_;
  SleepFunction sleep_;

  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
  std::mt19937 random_;
};

} // namespace scribe
