#include <scribe/parallel_group.h>

#include <scribe/errors.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <utility>

namespace scribe {
namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - started)
      .count();
}

} // namespace

PipelineStage::PipelineStage(std::string name, std::function<void()> body)
    : name_(std::move(name)), body_(std::move(body)) {}

StageResult PipelineStage::Run() const {
  const auto started = std::chrono::steady_clock::now();
  try {
    body_();
  } catch (const CancelledError &) {
    throw;
  } catch (const std::exception &ex) {
    return StageResult{name_, StageOutcome::kFailed, ElapsedMs(started),
                       std::string(ex.what())};
  }
  return StageResult{name_, StageOutcome::kCompleted, ElapsedMs(started),
                     std::nullopt};
}

ParallelGroup::ParallelGroup(std::string name,
                             std::vector<PipelineStage> stages,
                             std::size_t max_concurrency,
                             std::shared_ptr<Logger> logger,
                             std::optional<std::chrono::milliseconds> timeout)
    : name_(std::move(name)), stages_(std::move(stages)),
      max_concurrency_(max_concurrency),
      logger_(EnsureLogger(std::move(logger))), timeout_(timeout) {}

std::vector<StageResult>
ParallelGroup::Execute(const StageObserver &observer) const {
  std::vector<StageResult> results;
  results.reserve(stages_.size());
  for (const auto &stage : stages_) {
    results.push_back(StageResult{stage.Name(), StageOutcome::kSkipped, 0.0,
                                  std::nullopt});
  }
  if (stages_.empty()) {
    return results;
  }

  const auto started = std::chrono::steady_clock::now();
  std::mutex results_mutex;
  std::vector<bool> settled(stages_.size(), false);
  bool expired = false;

  const auto worker_count =
      max_concurrency_ == 0 ? stages_.size()
                            : std::min(max_concurrency_, stages_.size());
  std::atomic<std::size_t> next{0};
  const auto work = [&] {
    for (auto index = next.fetch_add(1); index < stages_.size();
         index = next.fetch_add(1)) {
      const auto &stage = stages_[index];
      {
        std::lock_guard<std::mutex> lock(results_mutex);
        if (expired) {
          return;
        }
      }
      if (observer.on_start) {
        observer.on_start(stage.Name());
      }
      auto outcome = stage.Run();
      {
        std::lock_guard<std::mutex> lock(results_mutex);
        if (expired) {
          continue;
        }
        results[index] = outcome;
        settled[index] = true;
      }
      if (observer.on_finish) {
        observer.on_finish(outcome);
      }
    }
  };

  std::vector<std::future<void>> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.push_back(std::async(std::launch::async, work));
  }

  if (timeout_) {
    const auto deadline = started + *timeout_;
    bool all_done = true;
    for (auto &worker : workers) {
      if (worker.wait_until(deadline) != std::future_status::ready) {
        all_done = false;
        break;
      }
    }
    if (!all_done) {
      std::vector<StageResult> overdue;
      {
        std::lock_guard<std::mutex> lock(results_mutex);
        expired = true;
        next.store(stages_.size());
        for (std::size_t index = 0; index < stages_.size(); ++index) {
          if (!settled[index]) {
            results[index] = StageResult{
                stages_[index].Name(), StageOutcome::kFailed,
                ElapsedMs(started),
                "timed out after " + std::to_string(timeout_->count()) +
                    " ms"};
            overdue.push_back(results[index]);
          }
        }
      }
      logger_->Log(LogLevel::kError, "parallel_group.timeout",
                   {{"group", name_},
                    {"timeout_ms", std::to_string(timeout_->count())},
                    {"overdue", std::to_string(overdue.size())}});
      if (observer.on_finish) {
        for (const auto &result : overdue) {
          observer.on_finish(result);
        }
      }
    }
  }

  // Join every worker before rethrowing so no thread outlives `results`.
  std::exception_ptr cancellation;
  for (auto &worker : workers) {
    try {
      worker.get();
    } catch (const CancelledError &) {
      if (!cancellation) {
        cancellation = std::current_exception();
      }
      next.store(stages_.size());
    }
  }
  if (cancellation) {
    std::rethrow_exception(cancellation);
  }

  const auto failed = std::count_if(
      results.begin(), results.end(), [](const StageResult &result) {
        return result.outcome == StageOutcome::kFailed;
      });
  logger_->Log(LogLevel::kDebug, "parallel_group.complete",
               {{"group", name_},
                {"stages", std::to_string(results.size())},
                {"failed", std::to_string(failed)}});
  return results;
}

} // namespace scribe
