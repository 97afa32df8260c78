#include <scribe/errors.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace scribe {
namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::tolower(character));
                 });
  return value;
}

template <std::size_t N>
bool ContainsAny(const std::string &text,
                 const std::array<std::string_view, N> &needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&text](std::string_view needle) {
                       return text.find(needle) != std::string::npos;
                     });
}

constexpr std::array<std::string_view, 2> kTimeoutPatterns = {"timeout",
                                                             "timed out"};
constexpr std::array<std::string_view, 3> kRateLimitPatterns = {
    "429", "rate limit", "rate_limit"};
constexpr std::array<std::string_view, 4> kServerPatterns = {"500", "502",
                                                            "503", "504"};
constexpr std::array<std::string_view, 2> kConnectionPatterns = {
    "econnrefused", "connection"};
constexpr std::array<std::string_view, 4> kClientPatterns = {"400", "401",
                                                            "403", "404"};

std::optional<ErrorClass> ClassifyStatus(int status) {
  if (status == 429) {
    return ErrorClass::kTransient;
  }
  if (status >= 400 && status < 500) {
    return ErrorClass::kClient;
  }
  if (status >= 500 && status < 600) {
    return ErrorClass::kServer;
  }
  return std::nullopt;
}

ErrorClass ClassifyMessage(const std::string &message) {
  const auto text = ToLower(message);
  if (ContainsAny(text, kTimeoutPatterns)) {
    return ErrorClass::kTimeout;
  }
  if (ContainsAny(text, kRateLimitPatterns)) {
    return ErrorClass::kTransient;
  }
  if (ContainsAny(text, kServerPatterns)) {
    return ErrorClass::kServer;
  }
  if (ContainsAny(text, kConnectionPatterns)) {
    return ErrorClass::kTransient;
  }
  if (ContainsAny(text, kClientPatterns)) {
    return ErrorClass::kClient;
  }
  return ErrorClass::kUnknown;
}

} // namespace

ModelCallError::ModelCallError(const std::string &message,
                               std::optional<int> status_code)
    : std::runtime_error(message), status_code_(status_code) {}

CircuitOpenError::CircuitOpenError(const std::string &model)
    : std::runtime_error("Circuit open for model: " + model), model_(model) {}

CancelledError::CancelledError() : std::runtime_error("Operation cancelled") {}

CancelledError::CancelledError(const std::string &message)
    : std::runtime_error(message) {}

std::string ToString(ErrorClass error_class) {
  switch (error_class) {
  case ErrorClass::kTransient:
    return "transient";
  case ErrorClass::kClient:
    return "client";
  case ErrorClass::kServer:
    return "server";
  case ErrorClass::kTimeout:
    return "timeout";
  case ErrorClass::kUnknown:
    return "unknown";
  }
  return "unknown";
}

ErrorClass ClassifyError(const std::exception &error) {
  if (const auto *model_error = dynamic_cast<const ModelCallError *>(&error)) {
    if (model_error->StatusCode()) {
      if (const auto by_status = ClassifyStatus(*model_error->StatusCode())) {
        return *by_status;
      }
    }
  }
  if (dynamic_cast<const CallTimeoutError *>(&error) != nullptr) {
    return ErrorClass::kTimeout;
  }
  return ClassifyMessage(error.what());
}

bool IsRetryable(ErrorClass error_class) {
  return error_class == ErrorClass::kTransient ||
         error_class == ErrorClass::kServer ||
         error_class == ErrorClass::kTimeout;
}

bool IsRetryable(const std::exception &error) {
  return IsRetryable(ClassifyError(error));
}

bool IsRateLimited(const std::exception &error) {
  if (const auto *model_error = dynamic_cast<const ModelCallError *>(&error)) {
    if (model_error->StatusCode()) {
      return *model_error->StatusCode() == 429;
    }
  }
  if (dynamic_cast<const CallTimeoutError *>(&error) != nullptr) {
    return false;
  }
  return ContainsAny(ToLower(error.what()), kRateLimitPatterns);
}

} // namespace scribe
