#include "upstream/retry_classifier.hpp"

namespace upstream {

const char* to_string(RetryDecision decision) {
  switch (decision) {
    case RetryDecision::Success:
      return "success";
    case RetryDecision::Retryable:
      return "retryable";
    case RetryDecision::Terminal:
      return "terminal";
  }
  return "unknown";
}

bool is_success_status(long status) {
  return status >= 200 && status < 300;
}

bool is_retryable_status(long status) {
  if (status == 429 || status == 503 || status == 504) {
    return true;
  }
  return status >= 500;
}

RetryDecision classify_status(long status) {
  if (is_success_status(status)) {
    return RetryDecision::Success;
  }
  return is_retryable_status(status) ? RetryDecision::Retryable : RetryDecision::Terminal;
}

RetryDecision classify_failure(FailureOrigin origin) {
  switch (origin) {
    case FailureOrigin::Transport:
    case FailureOrigin::Decode:
      return RetryDecision::Retryable;
    case FailureOrigin::Status:
    case FailureOrigin::Cancelled:
      return RetryDecision::Terminal;
  }
  return RetryDecision::Terminal;
}

bool should_retry(RetryDecision decision, std::size_t attempt, std::size_t max_attempts) {
  return decision == RetryDecision::Retryable && attempt + 1 < max_attempts;
}

}  // namespace upstream
