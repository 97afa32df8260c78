#pragma once

#include <scribe/logging.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

enum class StageOutcome { kCompleted, kFailed, kSkipped };

struct StageResult {
  std::string stage_name;
  StageOutcome outcome = StageOutcome::kSkipped;
  double duration_ms = 0.0;
  std::optional<std::string> error;
};

// A named unit of work. Run() records a failure instead of throwing; only
// CancelledError escapes.
class PipelineStage {
public:
  PipelineStage(std::string name, std::function<void()> body);

  StageResult Run() const;
  const std::string &Name() const { return name_; }

private:
  std::string name_;
  std::function<void()> body_;
};

struct StageObserver {
  std::function<void(const std::string &)> on_start;
  std::function<void(const StageResult &)> on_finish;
};

// Runs independent stages on worker threads with at most `max_concurrency`
// in flight (0 runs all at once). Results keep the order of `stages`.
//
// With a timeout, stages that have not finished by the deadline are
// reported as failed and pending ones are never started. Their workers are
// still joined before Execute returns, and whatever they finish later is
// discarded.
class ParallelGroup {
public:
  ParallelGroup(std::string name, std::vector<PipelineStage> stages,
                std::size_t max_concurrency = 0,
                std::shared_ptr<Logger> logger = nullptr,
                std::optional<std::chrono::milliseconds> timeout =
                    std::nullopt);

  std::vector<StageResult> Execute(const StageObserver &observer = {}) const;
  const std::string &Name() const { return name_; }

private:
  std::string name_;
  std::vector<PipelineStage> stages_;
  std::size_t max_concurrency_;
  std::shared_ptr<Logger> logger_;
  std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace scribe
