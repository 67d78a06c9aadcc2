#include "upstream/call_context.hpp"

#include "upstream/error.hpp"

#include <algorithm>

namespace upstream {

CallContext::CallContext(Clock::time_point deadline) : deadline_(deadline) {}

CallContext CallContext::with_timeout(std::chrono::milliseconds timeout) {
  return CallContext(Clock::now() + timeout);
}

void CallContext::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CallContext::is_cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CallContext::deadline_exceeded() const {
  return deadline_ && Clock::now() >= *deadline_;
}

bool CallContext::done() const {
  return is_cancelled() || deadline_exceeded();
}

std::optional<std::chrono::milliseconds> CallContext::remaining() const {
  if (!deadline_) {
    return std::nullopt;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

bool CallContext::wait_for(std::chrono::milliseconds duration) const {
  auto wake_at = Clock::now() + std::max(duration, std::chrono::milliseconds(0));
  const bool cut_by_deadline = deadline_ && *deadline_ < wake_at;
  if (cut_by_deadline) {
    wake_at = *deadline_;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (cv_.wait_until(lock, wake_at, [this] { return cancelled_; })) {
    return false;
  }
  return !cut_by_deadline;
}

void CallContext::check() const {
  if (is_cancelled()) {
    throw CancelledError("call cancelled");
  }
  if (deadline_exceeded()) {
    throw DeadlineExceededError("call deadline exceeded");
  }
}

}  // namespace upstream
