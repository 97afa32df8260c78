#pragma once

#include <atomic>
#include <string>

namespace scribe {

// Cooperative cancellation flag shared between a run and whoever may stop it.
class CancellationToken {
public:
  void Cancel() noexcept { cancelled_.store(true); }
  bool IsCancelled() const noexcept { return cancelled_.load(); }
  // Throws CancelledError naming the checkpoint when cancelled.
  void ThrowIfCancelled(const std::string &where) const;

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace scribe
