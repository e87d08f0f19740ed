#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace kata {

// Shared between the harness and one engine invocation. Cancelling twice is
// harmless; every waiter wakes on the first cancel.
class CancellationToken {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    changed_.notify_all();
  }

  bool isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Sleeps up to `duration`; returns true as soon as the token is cancelled.
  template <typename Rep, typename Period>
  bool waitFor(const std::chrono::duration<Rep, Period> &duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, duration, [this] { return cancelled_; });
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable changed_;
  bool cancelled_ = false;
};

} // namespace kata
