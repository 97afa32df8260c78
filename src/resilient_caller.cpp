#include <scribe/resilient_caller.h>

#include <scribe/errors.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <thread>
#include <utility>

namespace scribe {
namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point started) {
  return std::chrono::duration<double, std::milli>(Clock::now() - started)
      .count();
}

std::string TrimWhitespace(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

} // namespace

std::string StripMarkdownFences(const std::string &content) {
  auto text = TrimWhitespace(content);
  if (text.rfind("```", 0) != 0) {
    return text;
  }
  const auto first_newline = text.find('\n');
  if (first_newline == std::string::npos) {
    return "";
  }
  text.erase(0, first_newline + 1);
  const auto closing = text.rfind("```");
  if (closing != std::string::npos) {
    text.erase(closing);
  }
  return TrimWhitespace(text);
}

ResilientCaller::ResilientCaller(
    std::shared_ptr<ModelClient> client, RetryPolicy retry,
    BreakerPolicy breaker, std::shared_ptr<Logger> logger,
    std::shared_ptr<const TraceDispatcher> dispatcher, SleepFunction sleep)
    : client_(std::move(client)), retry_(retry), breaker_policy_(breaker),
      logger_(EnsureLogger(std::move(logger))),
      dispatcher_(std::move(dispatcher)), sleep_(std::move(sleep)),
      random_(std::random_device{}()) {
  if (retry_.max_attempts < 1) {
    throw std::invalid_argument("RetryPolicy.max_attempts must be >= 1.");
  }
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds wait) {
      std::this_thread::sleep_for(wait);
    };
  }
}

CircuitBreaker &ResilientCaller::BreakerFor(const std::string &model) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = breakers_[model];
  if (!slot) {
    slot = std::make_unique<CircuitBreaker>(model, breaker_policy_);
  }
  return *slot;
}

std::chrono::milliseconds ResilientCaller::BackoffFor(int attempt) {
  const auto base = std::min<std::chrono::milliseconds::rep>(
      retry_.max_wait.count(),
      retry_.initial_wait.count() << std::min(attempt - 1, 20));
  std::chrono::milliseconds::rep jitter = 0;
  if (base > 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<std::chrono::milliseconds::rep> spread(
        0, base / 2);
    jitter = spread(random_);
  }
  return std::chrono::milliseconds(
      std::min(retry_.max_wait.count(), base + jitter));
}

ModelCallResult ResilientCaller::GuardedCall(const std::string &model,
                                             const ModelRequest &request,
                                             const std::string &trace_id) {
  if (!client_) {
    throw std::runtime_error("No model client configured.");
  }
  auto &breaker = BreakerFor(model);
  for (int attempt = 1;; ++attempt) {
    if (!breaker.AllowRequest()) {
      throw CircuitOpenError(model);
    }
    const auto started = Clock::now();
    try {
      auto response =
          client_->Call(model, request.messages, request.timeout, request.mode);
      breaker.RecordSuccess();
      const auto duration_ms = ElapsedMs(started);
      if (dispatcher_) {
        EmitLlmCall(*dispatcher_, trace_id, model, response.input_tokens,
                    response.output_tokens, duration_ms, response.cost);
      }
      logger_->Log(LogLevel::kDebug, "model.call.complete",
                   {{"model", model},
                    {"input_tokens", std::to_string(response.input_tokens)},
                    {"output_tokens", std::to_string(response.output_tokens)}});
      return ModelCallResult{model, std::move(response.content),
                             response.input_tokens, response.output_tokens};
    } catch (const std::exception &ex) {
      const bool rate_limited = IsRateLimited(ex);
      if (!rate_limited) {
        breaker.RecordFailure();
      }
      if (!rate_limited || attempt >= retry_.max_attempts) {
        throw;
      }
      const auto wait = BackoffFor(attempt);
      logger_->Log(LogLevel::kWarn, "model.call.retry",
                   {{"model", model},
                    {"attempt", std::to_string(attempt)},
                    {"wait_ms", std::to_string(wait.count())},
                    {"error", ex.what()}});
      sleep_(wait);
    }
  }
}

std::optional<ModelCallResult>
ResilientCaller::CallWithFallback(const std::vector<std::string> &model_chain,
                                  const ModelRequest &request,
                                  const std::string &trace_id) {
  for (const auto &model : model_chain) {
    try {
      auto result = GuardedCall(model, request, trace_id);
      auto content = StripMarkdownFences(result.content);
      if (content.size() < std::max<std::size_t>(request.min_content_length, 1)) {
        logger_->Log(LogLevel::kWarn, "model.response.rejected",
                     {{"model", model},
                      {"length", std::to_string(content.size())}});
        continue;
      }
      result.content = std::move(content);
      return result;
    } catch (const CircuitOpenError &) {
      logger_->Log(LogLevel::kWarn, "model.circuit.open", {{"model", model}});
    } catch (const CancelledError &) {
      throw;
    } catch (const std::exception &ex) {
      const auto error_class = ClassifyError(ex);
      logger_->Log(LogLevel::kWarn, "model.call.failed",
                   {{"model", model},
                    {"error_class", ToString(error_class)},
                    {"retryable", IsRetryable(error_class) ? "true" : "false"},
                    {"error", ex.what()}});
    }
  }
  logger_->Log(LogLevel::kWarn, "model.chain.exhausted",
               {{"models", std::to_string(model_chain.size())}});
  return std::nullopt;
}

} // namespace scribe
