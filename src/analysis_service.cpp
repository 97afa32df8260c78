#include <scribe/analysis_service.h>

#include <scribe/errors.h>
#include <scribe/stream_events.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace scribe {
namespace {

constexpr const char *kRunFailedMessage =
    "Analysis failed. Check server logs for details.";

// Reads from the run's queue while keeping the queue alive after the run
// entry is replaced.
class PrimaryStream : public EventStream {
public:
  explicit PrimaryStream(std::shared_ptr<DeliveryQueue> queue)
      : queue_(std::move(queue)) {}

  std::optional<StreamEnvelope> Next() override { return queue_->Next(); }

private:
  std::shared_ptr<DeliveryQueue> queue_;
};

} // namespace

std::string AnalysisKey(const std::string &project_id) {
  return "analyze:" + project_id;
}

AnalysisService::AnalysisService(
    std::shared_ptr<const PipelineRunner> runner,
    std::shared_ptr<ProgressChannel> channel,
    std::shared_ptr<IdempotencyGuard<RunResult>> guard,
    std::shared_ptr<Logger> logger)
    : runner_(std::move(runner)), channel_(std::move(channel)),
      guard_(std::move(guard)), logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    throw std::invalid_argument("AnalysisService requires a PipelineRunner.");
  }
  if (!channel_) {
    channel_ = std::make_shared<ProgressChannel>();
  }
  if (!guard_) {
    guard_ = std::make_shared<IdempotencyGuard<RunResult>>();
  }
}

AnalysisService::~AnalysisService() {
  std::vector<std::shared_ptr<ActiveRun>> runs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[project_id, run] : runs_) {
      runs.push_back(run);
    }
    runs_.clear();
    runs.insert(runs.end(), retired_.begin(), retired_.end());
    retired_.clear();
  }
  for (auto &run : runs) {
    run->token->Cancel();
  }
  for (auto &run : runs) {
    if (run->worker.joinable()) {
      run->worker.join();
    }
  }
}

std::unique_ptr<EventStream>
AnalysisService::Start(const std::string &project_id,
                       const std::string &repo_path,
                       const std::string &branch) {
  if (project_id.empty()) {
    throw std::invalid_argument("project_id must not be empty.");
  }
  const auto key = AnalysisKey(project_id);

  std::lock_guard<std::mutex> lock(mutex_);
  ReapFinished();
  auto run = std::make_shared<ActiveRun>();
  const auto existing = runs_.find(project_id);
  if (existing != runs_.end()) {
    if (!existing->second->finished.load() && channel_->IsActive(key)) {
      logger_->Log(LogLevel::kInfo, "analysis.joined",
                   {{"project_id", project_id}});
      return channel_->Subscribe(key);
    }
    // A paused run may still be unwinding inside a slow stage. It no longer
    // touches the channel, so the new run starts without waiting for it.
    if (!existing->second->finished.load()) {
      run->previous = existing->second;
    }
    retired_.push_back(existing->second);
    runs_.erase(existing);
  }

  channel_->CreateChannel(key);

  RunContext context;
  context.project_id = project_id;
  context.repo_path = repo_path;
  context.branch = branch;
  context.cancellation = run->token;
  context.on_progress = [this, target = run.get(),
                         key](const StageEvent &event) {
    Deliver(*target, key, MakeStageEnvelope(event));
  };

  runs_[project_id] = run;
  run->worker = std::thread(
      [this, run, context = std::move(context)]() mutable {
        Execute(run, std::move(context));
      });
  logger_->Log(LogLevel::kInfo, "analysis.started",
               {{"project_id", project_id}, {"repo_path", repo_path}});
  return std::make_unique<PrimaryStream>(run->queue);
}

void AnalysisService::Execute(const std::shared_ptr<ActiveRun> &run,
                              RunContext context) {
  const auto key = AnalysisKey(context.project_id);
  try {
    if (run->previous) {
      run->previous->result.wait();
      run->previous.reset();
    }
    auto result = guard_->Execute(key, [this, &context] {
      return runner_->Run(context);
    });
    Deliver(*run, key, MakeCompleteEnvelope(result));
    run->outcome.set_value(std::move(result));
  } catch (const CancelledError &ex) {
    logger_->Log(LogLevel::kInfo, "analysis.cancelled",
                 {{"project_id", context.project_id}, {"reason", ex.what()}});
    run->outcome.set_exception(std::current_exception());
  } catch (const std::exception &ex) {
    logger_->Log(LogLevel::kError, "analysis.failed",
                 {{"project_id", context.project_id}, {"error", ex.what()}});
    Deliver(*run, key, MakeErrorEnvelope(kRunFailedMessage));
    run->outcome.set_exception(std::current_exception());
  }
  run->queue->Close();
  Retire(run, context.project_id);
  run->finished.store(true);
}

void AnalysisService::Deliver(ActiveRun &run, const std::string &key,
                              const StreamEnvelope &envelope) {
  std::lock_guard<std::mutex> lock(run.publish_mutex);
  if (run.detached) {
    return;
  }
  channel_->Publish(key, envelope);
  run.queue->Push(envelope);
}

void AnalysisService::Retire(const std::shared_ptr<ActiveRun> &run,
                             const std::string &project_id) {
  const auto key = AnalysisKey(project_id);
  std::lock_guard<std::mutex> lock(mutex_);
  std::lock_guard<std::mutex> publish_lock(run->publish_mutex);
  const auto current = runs_.find(project_id);
  // A replaced run must not release the channel of its successor.
  if (current != runs_.end() && current->second == run) {
    run->history = channel_->LatestEvents(key);
    channel_->Release(key);
  }
  run->detached = true;
}

void AnalysisService::ReapFinished() {
  auto unwinding = retired_.begin();
  for (auto &run : retired_) {
    if (run->finished.load()) {
      if (run->worker.joinable()) {
        run->worker.join();
      }
    } else {
      *unwinding++ = std::move(run);
    }
  }
  retired_.erase(unwinding, retired_.end());
}

bool AnalysisService::Pause(const std::string &project_id) {
  const auto run = FindRun(project_id);
  if (!run) {
    return false;
  }
  const auto key = AnalysisKey(project_id);
  {
    std::lock_guard<std::mutex> lock(run->publish_mutex);
    if (run->detached) {
      return false;
    }
    run->detached = true;
    const auto envelope = MakePausedEnvelope();
    // Closing the queue right away keeps `paused` the last envelope the
    // starting caller sees.
    run->queue->Push(envelope);
    run->queue->Close();
    run->token->Cancel();
    channel_->Publish(key, envelope);
    channel_->Complete(key);
  }
  logger_->Log(LogLevel::kInfo, "analysis.paused",
               {{"project_id", project_id}});
  return true;
}

bool AnalysisService::IsRunning(const std::string &project_id) const {
  const auto run = FindRun(project_id);
  return run && !run->finished.load();
}

std::vector<StageSnapshot>
AnalysisService::Status(const std::string &project_id) const {
  auto events = channel_->LatestEvents(AnalysisKey(project_id));
  if (!events.empty()) {
    return DeriveStages(events);
  }
  // Released channels leave their history with the run.
  const auto run = FindRun(project_id);
  if (!run) {
    return {};
  }
  std::lock_guard<std::mutex> lock(run->publish_mutex);
  return DeriveStages(run->history);
}

RunResult AnalysisService::Wait(const std::string &project_id) const {
  const auto run = FindRun(project_id);
  if (!run) {
    throw std::invalid_argument("No analysis run for project: " + project_id);
  }
  return run->result.get();
}

std::shared_ptr<AnalysisService::ActiveRun>
AnalysisService::FindRun(const std::string &project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = runs_.find(project_id);
  if (found == runs_.end()) {
    return nullptr;
  }
  return found->second;
}

} // namespace scribe
