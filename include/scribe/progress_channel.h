#pragma once

#include <scribe/stream_events.h>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scribe {

// Pull-based sequence of envelopes. Next() blocks until an envelope is
// available and returns nullopt once the stream has ended.
class EventStream {
public:
  virtual ~EventStream() = default;
  virtual std::optional<StreamEnvelope> Next() = 0;
};

// Dedicated delivery path for the consumer that started a run. Everything
// pushed before Close() is delivered.
class DeliveryQueue : public EventStream {
public:
  void Push(StreamEnvelope envelope);
  void Close();
  bool Closed() const;
  std::optional<StreamEnvelope> Next() override;

private:
  mutable std::mutex mutex_;
  std::condition_variable changed_;
  std::deque<StreamEnvelope> pending_;
  bool closed_ = false;
};

// Per-run broadcast log. Subscribers replay the history from the start and
// then follow live events until the channel is completed.
class ProgressChannel {
public:
  struct Log {
    mutable std::mutex mutex;
    std::condition_variable changed;
    std::vector<StreamEnvelope> events;
    bool completed = false;
  };

  class Subscription : public EventStream {
  public:
    explicit Subscription(std::shared_ptr<Log> log);
    std::optional<StreamEnvelope> Next() override;

  private:
    std::shared_ptr<Log> log_;
    std::size_t cursor_ = 0;
  };

  // Creates the channel, or resets it when one already exists. Readers of a
  // reset channel see it completed.
  void CreateChannel(const std::string &key);
  bool HasChannel(const std::string &key) const;
  // Exists and has not been completed.
  bool IsActive(const std::string &key) const;
  // No-op for unknown or completed channels.
  void Publish(const std::string &key, StreamEnvelope envelope);
  void Complete(const std::string &key);
  // Unknown keys yield a stream that ends immediately.
  std::unique_ptr<Subscription> Subscribe(const std::string &key) const;
  std::vector<StreamEnvelope> LatestEvents(const std::string &key) const;
  // Drops the history. Existing subscriptions keep what they reference.
  void Release(const std::string &key);

private:
  std::shared_ptr<Log> Find(const std::string &key) const;
  static void MarkCompleted(Log &log);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Log>> channels_;
};

} // namespace scribe
