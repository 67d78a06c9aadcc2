#pragma once

#include <cstddef>

#include "upstream/error.hpp"

namespace upstream {

enum class RetryDecision { Success, Retryable, Terminal };

const char* to_string(RetryDecision decision);

bool is_success_status(long status);

// 429, 503, 504 and every other 5xx.
bool is_retryable_status(long status);

RetryDecision classify_status(long status);

/**
 * Transport and decode failures are transient. Cancellation and caller
 * deadlines end the call immediately.
 */
RetryDecision classify_failure(FailureOrigin origin);

/**
 * True when `decision` permits another attempt after the 0-based attempt
 * `attempt` within a budget of `max_attempts`.
 */
bool should_retry(RetryDecision decision, std::size_t attempt, std::size_t max_attempts);

}  // namespace upstream
