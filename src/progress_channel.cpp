#include <scribe/progress_channel.h>

#include <utility>

namespace scribe {

void DeliveryQueue::Push(StreamEnvelope envelope) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    pending_.push_back(std::move(envelope));
  }
  changed_.notify_all();
}

void DeliveryQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  changed_.notify_all();
}

bool DeliveryQueue::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::optional<StreamEnvelope> DeliveryQueue::Next() {
  std::unique_lock<std::mutex> lock(mutex_);
  changed_.wait(lock, [this] { return closed_ || !pending_.empty(); });
  if (pending_.empty()) {
    return std::nullopt;
  }
  auto envelope = std::move(pending_.front());
  pending_.pop_front();
  return envelope;
}

ProgressChannel::Subscription::Subscription(std::shared_ptr<Log> log)
    : log_(std::move(log)) {}

std::optional<StreamEnvelope> ProgressChannel::Subscription::Next() {
  if (!log_) {
    return std::nullopt;
  }
  std::unique_lock<std::mutex> lock(log_->mutex);
  log_->changed.wait(lock, [this] {
    return log_->completed || cursor_ < log_->events.size();
  });
  if (cursor_ < log_->events.size()) {
    return log_->events[cursor_++];
  }
  return std::nullopt;
}

void ProgressChannel::CreateChannel(const std::string &key) {
  std::shared_ptr<Log> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &slot = channels_[key];
    previous = std::move(slot);
    slot = std::make_shared<Log>();
  }
  if (previous) {
    MarkCompleted(*previous);
  }
}

bool ProgressChannel::HasChannel(const std::string &key) const {
  return Find(key) != nullptr;
}

bool ProgressChannel::IsActive(const std::string &key) const {
  const auto log = Find(key);
  if (!log) {
    return false;
  }
  std::lock_guard<std::mutex> lock(log->mutex);
  return !log->completed;
}

void ProgressChannel::Publish(const std::string &key,
                              StreamEnvelope envelope) {
  const auto log = Find(key);
  if (!log) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(log->mutex);
    if (log->completed) {
      return;
    }
    log->events.push_back(std::move(envelope));
  }
  log->changed.notify_all();
}

void ProgressChannel::Complete(const std::string &key) {
  if (const auto log = Find(key)) {
    MarkCompleted(*log);
  }
}

std::unique_ptr<ProgressChannel::Subscription>
ProgressChannel::Subscribe(const std::string &key) const {
  return std::make_unique<Subscription>(Find(key));
}

std::vector<StreamEnvelope>
ProgressChannel::LatestEvents(const std::string &key) const {
  const auto log = Find(key);
  if (!log) {
    return {};
  }
  std::lock_guard<std::mutex> lock(log->mutex);
  return log->events;
}

void ProgressChannel::Release(const std::string &key) {
  std::shared_ptr<Log> released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto found = channels_.find(key);
    if (found == channels_.end()) {
      return;
    }
    released = std::move(found->second);
    channels_.erase(found);
  }
  MarkCompleted(*released);
}

std::shared_ptr<ProgressChannel::Log>
ProgressChannel::Find(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = channels_.find(key);
  if (found == channels_.end()) {
    return nullptr;
  }
  return found->second;
}

void ProgressChannel::MarkCompleted(Log &log) {
  {
    std::lock_guard<std::mutex> lock(log.mutex);
    log.completed = true;
  }
  log.changed.notify_all();
}

} // namespace scribe
