#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scribe {

// Collapses concurrent Execute calls that share a key into one run of the
// operation. The first caller for a key owns the run; everyone else blocks
// on the owner's outcome and receives the same value or the same exception.
// Keys are only deduplicated while in flight; a call that arrives after the
// owner removed its key starts a fresh run.
template <typename Result> class IdempotencyGuard {
public:
  using Operation = std::function<Result()>;

  Result Execute(const std::string &key, const Operation &operation) {
    std::shared_ptr<InFlightOperation> tracker;
    bool owner = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto &slot = in_flight_[key];
      if (!slot) {
        slot = std::make_shared<InFlightOperation>(key);
        owner = true;
      }
      tracker = slot;
    }
    if (!owner) {
      return tracker->completion.get();
    }
    return RunAsOwner(tracker, operation);
  }

  std::vector<std::string> ActiveKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(in_flight_.size());
    for (const auto &[key, tracker] : in_flight_) {
      keys.push_back(key);
    }
    return keys;
  }

private:
  struct InFlightOperation {
    explicit InFlightOperation(std::string operation_key)
        : key(std::move(operation_key)),
          completion(outcome.get_future().share()) {}

    std::string key;
    std::promise<Result> outcome;
    std::shared_future<Result> completion;
  };

  Result RunAsOwner(const std::shared_ptr<InFlightOperation> &tracker,
                    const Operation &operation) {
    std::optional<Result> value;
    std::exception_ptr error;
    try {
      value.emplace(operation());
    } catch (...) {
      error = std::current_exception();
    }

    // Signal first, then drop the key in a second critical section. A caller
    // landing between the two sees the finished tracker and returns its
    // outcome without running the operation again.
    if (error) {
      tracker->outcome.set_exception(error);
    } else {
      tracker->outcome.set_value(*value);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto found = in_flight_.find(tracker->key);
      if (found != in_flight_.end() && found->second == tracker) {
        in_flight_.erase(found);
      }
    }

    if (error) {
      std::rethrow_exception(error);
    }
    return std::move(*value);
  }

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<InFlightOperation>>
      in_flight_;
};

} // namespace scribe
