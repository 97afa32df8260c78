#include <scribe/logging.h>

#include <scribe/escaping.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <ostream>
#include <stdexcept>

namespace scribe {
namespace {

// UTC, millisecond precision, so records from worker threads sort cleanly.
std::string UtcNow() {
  const auto now = std::chrono::system_clock::now();
  const auto seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count() %
                      1000;
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buffer;
}

void AppendQuoted(std::string &line, std::string_view text) {
  line.push_back('"');
  line.append(EscapeJsonString(std::string(text)));
  line.push_back('"');
}

std::string RenderRecord(LogLevel level, std::string_view message,
                         const LogFields &fields) {
  std::string line = "[" + UtcNow() + "] level=" + LevelName(level) +
                     " message=";
  AppendQuoted(line, message);
  line.append(" fields={");
  bool first = true;
  for (const auto &[key, value] : fields) {
    if (!first) {
      line.append(", ");
    }
    first = false;
    AppendQuoted(line, key);
    line.append(": ");
    AppendQuoted(line, value);
  }
  line.append("}\n");
  return line;
}

} // namespace

std::string LevelName(LogLevel level) {
  static constexpr const char *kNames[] = {"error", "warn", "info", "debug"};
  const auto index = static_cast<int>(level);
  return index >= 0 && index < 4 ? kNames[index] : "unknown";
}

LogLevel ParseLogLevel(const std::string &value) {
  std::string name;
  for (const auto character : value) {
    const auto byte = static_cast<unsigned char>(character);
    if (std::isspace(byte) == 0) {
      name.push_back(static_cast<char>(std::tolower(byte)));
    }
  }
  if (name == "warning") {
    return LogLevel::kWarn;
  }
  for (const auto level :
       {LogLevel::kError, LogLevel::kWarn, LogLevel::kInfo, LogLevel::kDebug}) {
    if (name == LevelName(level)) {
      return level;
    }
  }
  throw std::invalid_argument("Unknown log level: " + value);
}

StructuredLogger::StructuredLogger(std::ostream &stream, LoggingConfig config)
    : stream_(&stream), config_(config) {}

void StructuredLogger::Log(LogLevel level, std::string_view message,
                           LogFields fields) {
  if (!IsEnabled(level)) {
    return;
  }
  const auto record = RenderRecord(level, message, fields);
  std::lock_guard<std::mutex> lock(mutex_);
  stream_->write(record.data(), static_cast<std::streamsize>(record.size()));
}

std::shared_ptr<Logger> EnsureLogger(std::shared_ptr<Logger> logger) {
  return logger ? std::move(logger) : std::make_shared<NullLogger>();
}

std::shared_ptr<Logger> MakeLogger(const LoggingConfig &config,
                                   std::ostream &stream) {
  return std::make_shared<StructuredLogger>(stream, config);
}

} // namespace scribe
