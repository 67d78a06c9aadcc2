#include "upstream/executor.hpp"

#include "upstream/utils/values.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <set>
#include <utility>

namespace upstream {
namespace {

using json = nlohmann::json;

enum class CallState { Attempting, Retrying, Success, Failed };

struct Outcome {
  std::optional<HttpResponse> response;
  std::optional<FailureOrigin> failure;
  std::optional<long> status_code;
  std::string cause;
};

std::string describe(const HttpRequest& request) {
  return request.method + " " + request.url;
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie", "proxy-authorization"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    std::string lowered; lowered.reserve(key.size());
    std::transform(key.begin(), key.end(), std::back_inserter(lowered), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    if (kSensitive.count(lowered)) {
      sanitized[key] = "***";
    } else {
      sanitized[key] = value;
    }
  }
  return sanitized;
}

json build_request_log_details(const HttpRequest& request, std::size_t attempt) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["attempt"] = static_cast<int>(attempt);
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

json build_outcome_log_details(const HttpRequest& request,
                               const Outcome& outcome,
                               RetryDecision decision,
                               std::chrono::steady_clock::duration duration,
                               std::size_t attempt) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["attempt"] = static_cast<int>(attempt);
  details["decision"] = to_string(decision);
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  if (outcome.status_code) {
    details["status"] = *outcome.status_code;
  }
  if (outcome.response) {
    details["response_headers"] = sanitize_headers(outcome.response->headers);
  }
  if (outcome.failure && *outcome.failure != FailureOrigin::Status) {
    details["failure"] = to_string(*outcome.failure);
    details["error"] = outcome.cause;
  }
  return details;
}

// The per-attempt transport timeout never outlives the caller's deadline.
std::chrono::milliseconds attempt_timeout(std::chrono::milliseconds configured, const CallContext& context) {
  auto remaining = context.remaining();
  if (!remaining) {
    return configured;
  }
  auto timeout = configured.count() > 0 ? std::min(configured, *remaining) : *remaining;
  return std::max(timeout, std::chrono::milliseconds(1));
}

Outcome run_attempt(HttpClient& http_client, const HttpRequest& request) {
  Outcome outcome;
  try {
    HttpResponse response = http_client.request(request);
    outcome.status_code = response.status_code;
    if (!is_success_status(response.status_code)) {
      outcome.failure = FailureOrigin::Status;
      outcome.cause = "HTTP " + std::to_string(response.status_code);
    }
    outcome.response = std::move(response);
  } catch (const CancelledError& error) {
    outcome.failure = FailureOrigin::Cancelled;
    outcome.cause = error.what();
  } catch (const RequestError& error) {
    outcome.failure = error.origin() == FailureOrigin::Decode ? FailureOrigin::Decode : FailureOrigin::Transport;
    outcome.status_code = error.status_code();
    outcome.cause = error.what();
  } catch (const std::exception& error) {
    outcome.failure = FailureOrigin::Transport;
    outcome.cause = error.what();
  }
  return outcome;
}

[[noreturn]] void throw_cancelled(const CallContext& context, const HttpRequest& request, std::size_t attempts) {
  const std::string suffix = " after " + std::to_string(attempts) + " attempt(s)";
  if (!context.is_cancelled() && context.deadline_exceeded()) {
    throw DeadlineExceededError(describe(request) + ": deadline exceeded" + suffix, attempts);
  }
  throw CancelledError(describe(request) + ": cancelled" + suffix, attempts);
}

[[noreturn]] void throw_failure(const HttpRequest& request,
                                const Outcome& outcome,
                                RetryDecision decision,
                                std::size_t attempts,
                                const CallContext& context) {
  const FailureOrigin origin = outcome.failure.value_or(FailureOrigin::Transport);
  if (origin == FailureOrigin::Cancelled) {
    throw_cancelled(context, request, attempts);
  }

  std::string body = outcome.response ? outcome.response->body : std::string();
  if (decision == RetryDecision::Retryable) {
    throw RetriesExhaustedError(describe(request) + ": request failed after " + std::to_string(attempts) +
                                    " attempt(s): " + outcome.cause,
                                origin,
                                outcome.status_code,
                                std::move(body),
                                outcome.cause,
                                attempts);
  }

  const std::string prefix = describe(request) + ": attempt " + std::to_string(attempts) + ": ";
  switch (origin) {
    case FailureOrigin::Status: {
      const long status = outcome.status_code.value_or(0);
      auto headers = outcome.response ? outcome.response->headers : std::map<std::string, std::string>{};
      throw StatusError(prefix + "status " + std::to_string(status) + ": " + body,
                        status,
                        std::move(body),
                        std::move(headers),
                        attempts);
    }
    case FailureOrigin::Decode:
      throw DecodeError(prefix + outcome.cause, outcome.status_code, outcome.cause, attempts);
    case FailureOrigin::Transport:
    case FailureOrigin::Cancelled:
      break;
  }
  throw TransportError(prefix + outcome.cause, outcome.cause, attempts);
}

}  // namespace

void validate_retry_policy(const RetryPolicy& policy) {
  if (policy.max_attempts == 0) {
    throw UpstreamError("RetryPolicy.max_attempts must be at least 1");
  }
  utils::validate_positive_integer("RetryPolicy.base_delay", policy.base_delay.count());
  utils::validate_positive_integer("RetryPolicy.max_backoff", policy.max_backoff.count());
}

RequestExecutor::RequestExecutor(ExecutorOptions options, std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      backoff_(options_.retry.max_backoff, options_.jitter),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()) {
  validate_retry_policy(options_.retry);
}

void RequestExecutor::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!options_.logger) {
    return;
  }
  if (static_cast<int>(level) > static_cast<int>(options_.log_level)) {
    return;
  }
  // A failing sink must not fail the call.
  try {
    options_.logger(level, message, details);
  } catch (const std::exception&) {
    return;
  }
}

void RequestExecutor::notify(const AttemptRecord& record) const {
  if (!options_.attempt_observer) {
    return;
  }
  try {
    options_.attempt_observer(record);
  } catch (const std::exception& error) {
    log(LogLevel::Warn, "attempt observer failed", json{{"error", error.what()}});
  }
}

HttpResponse RequestExecutor::execute(const HttpRequest& request, const CallContext& context) const {
  return execute(request, options_.retry.max_attempts, options_.retry.base_delay, context);
}

HttpResponse RequestExecutor::execute(const HttpRequest& request,
                                      std::size_t max_attempts,
                                      std::chrono::milliseconds base_delay,
                                      const CallContext& context) const {
  if (max_attempts == 0) {
    throw UpstreamError("max_attempts must be at least 1");
  }

  CallState state = CallState::Attempting;
  std::size_t attempt = 0;
  Outcome outcome;
  RetryDecision decision = RetryDecision::Terminal;
  std::chrono::milliseconds delay{0};

  while (true) {
    switch (state) {
      case CallState::Attempting: {
        if (context.done()) {
          log(LogLevel::Error, "request cancelled", build_request_log_details(request, attempt));
          throw_cancelled(context, request, attempt);
        }

        HttpRequest attempt_request = request;
        attempt_request.timeout = attempt_timeout(request.timeout, context);
        attempt_request.abort_requested = [&context, &request] {
          return context.done() || (request.abort_requested && request.abort_requested());
        };

        log(LogLevel::Debug, "sending request", build_request_log_details(attempt_request, attempt));
        const auto start_time = std::chrono::steady_clock::now();
        outcome = run_attempt(*http_client_, attempt_request);
        const auto duration = std::chrono::steady_clock::now() - start_time;

        // Whatever the transport reported, a caller that gave up sees a cancellation.
        if (outcome.failure && context.done()) {
          outcome.failure = FailureOrigin::Cancelled;
        }

        if (!outcome.failure) {
          decision = RetryDecision::Success;
        } else if (*outcome.failure == FailureOrigin::Status) {
          decision = classify_status(outcome.status_code.value_or(0));
        } else {
          decision = classify_failure(*outcome.failure);
        }

        AttemptRecord record;
        record.attempt = attempt;
        record.method = request.method;
        record.url = request.url;
        record.elapsed = duration;
        record.status_code = outcome.status_code;
        record.failure = outcome.failure;
        record.error = outcome.cause;
        record.decision = decision;

        auto details = build_outcome_log_details(attempt_request, outcome, decision, duration, attempt);
        if (decision == RetryDecision::Success) {
          log(LogLevel::Info, "request succeeded", details);
          state = CallState::Success;
        } else if (should_retry(decision, attempt, max_attempts)) {
          delay = backoff_.delay(attempt, base_delay);
          record.retry_delay = delay;
          details["retry_delay_ms"] = delay.count();
          log(LogLevel::Warn, "retrying request", details);
          state = CallState::Retrying;
        } else {
          log(LogLevel::Error, "request failed", details);
          state = CallState::Failed;
        }
        notify(record);
        break;
      }
      case CallState::Retrying:
        if (!context.wait_for(delay)) {
          log(LogLevel::Error, "request cancelled", build_request_log_details(request, attempt + 1));
          throw_cancelled(context, request, attempt + 1);
        }
        ++attempt;
        state = CallState::Attempting;
        break;
      case CallState::Success:
        return std::move(*outcome.response);
      case CallState::Failed:
        throw_failure(request, outcome, decision, attempt + 1, context);
    }
  }
}

}  // namespace upstream
