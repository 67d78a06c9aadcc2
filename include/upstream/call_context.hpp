#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace upstream {

/**
 * Cancellation and deadline for one logical upstream call.
 *
 * cancel() may be invoked from any thread and wakes every pending
 * wait_for(). A context is "done" once cancelled or past its deadline;
 * it never becomes un-done.
 */
class CallContext {
public:
  using Clock = std::chrono::steady_clock;

  CallContext() = default;
  explicit CallContext(Clock::time_point deadline);

  CallContext(const CallContext&) = delete;
  CallContext& operator=(const CallContext&) = delete;

  static CallContext with_timeout(std::chrono::milliseconds timeout);

  void cancel();

  bool is_cancelled() const;
  bool deadline_exceeded() const;
  bool done() const;

  const std::optional<Clock::time_point>& deadline() const { return deadline_; }

  // Time left before the deadline, zero once passed; nullopt without a deadline.
  std::optional<std::chrono::milliseconds> remaining() const;

  /**
   * Blocks for `duration` unless the context becomes done first.
   * Returns true when the full duration elapsed.
   */
  bool wait_for(std::chrono::milliseconds duration) const;

  // Throws CancelledError or DeadlineExceededError when done.
  void check() const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  std::optional<Clock::time_point> deadline_;
};

}  // namespace upstream
