#pragma once

#include <scribe/cancellation.h>
#include <scribe/idempotency_guard.h>
#include <scribe/logging.h>
#include <scribe/pipeline_runner.h>
#include <scribe/progress_channel.h>

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace scribe {

// Channel and guard key of a project's analysis run.
std::string AnalysisKey(const std::string &project_id);

// Application-facing entry point. Each project has at most one run in
// flight; it executes on a background thread and streams its envelopes to
// the caller that started it, while later callers join through the
// progress channel.
class AnalysisService {
public:
  AnalysisService(std::shared_ptr<const PipelineRunner> runner,
                  std::shared_ptr<ProgressChannel> channel = nullptr,
                  std::shared_ptr<IdempotencyGuard<RunResult>> guard = nullptr,
                  std::shared_ptr<Logger> logger = nullptr);
  ~AnalysisService();

  AnalysisService(const AnalysisService &) = delete;
  AnalysisService &operator=(const AnalysisService &) = delete;

  // Starts a run, or subscribes to the one already in progress. The stream
  // ends after the run's complete, error or paused envelope.
  std::unique_ptr<EventStream> Start(const std::string &project_id,
                                     const std::string &repo_path,
                                     const std::string &branch = "main");

  // Returns false when no run for the project is in progress.
  bool Pause(const std::string &project_id);

  bool IsRunning(const std::string &project_id) const;
  std::vector<StageSnapshot> Status(const std::string &project_id) const;

  // Blocks until the latest run of the project ends. Rethrows its failure,
  // CancelledError included. Throws std::invalid_argument for a project
  // that was never started.
  RunResult Wait(const std::string &project_id) const;

  const ProgressChannel &Channel() const { return *channel_; }

private:
  struct ActiveRun {
    std::shared_ptr<CancellationToken> token =
        std::make_shared<CancellationToken>();
    std::shared_ptr<DeliveryQueue> queue = std::make_shared<DeliveryQueue>();
    std::promise<RunResult> outcome;
    std::shared_future<RunResult> result = outcome.get_future().share();
    std::atomic<bool> finished{false};
    std::thread worker;
    // Run replaced by this one after a pause. Awaited before the pipeline
    // starts so both never share a guard key.
    std::shared_ptr<ActiveRun> previous;

    std::mutex publish_mutex;
    // Set once the run stops writing to the channel (paused or retired).
    bool detached = false;
    // Channel history kept after the channel is released.
    std::vector<StreamEnvelope> history;
  };

  void Execute(const std::shared_ptr<ActiveRun> &run, RunContext context);
  void Deliver(ActiveRun &run, const std::string &key,
               const StreamEnvelope &envelope);
  void Retire(const std::shared_ptr<ActiveRun> &run,
              const std::string &project_id);
  void ReapFinished();
  std::shared_ptr<ActiveRun> FindRun(const std::string &project_id) const;

  std::shared_ptr<const PipelineRunner> runner_;
  std::shared_ptr<ProgressChannel> channel_;
  std::shared_ptr<IdempotencyGuard<RunResult>> guard_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<ActiveRun>> runs_;
  // Paused runs still unwinding. Joined once finished or on destruction.
  std::vector<std::shared_ptr<ActiveRun>> retired_;
};

} // namespace scribe
