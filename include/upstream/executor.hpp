#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "upstream/backoff.hpp"
#include "upstream/call_context.hpp"
#include "upstream/error.hpp"
#include "upstream/http_client.hpp"
#include "upstream/logging.hpp"
#include "upstream/retry_classifier.hpp"

namespace upstream {

struct RetryPolicy {
  std::chrono::milliseconds base_delay{1000};
  std::size_t max_attempts = 3;
  std::chrono::milliseconds max_backoff = kDefaultMaxBackoff;
};

// Throws UpstreamError when the policy cannot drive a call.
void validate_retry_policy(const RetryPolicy& policy);

/**
 * What happened on one attempt. Handed to the attempt observer and then
 * discarded.
 */
struct AttemptRecord {
  std::size_t attempt = 0;
  std::string method;
  std::string url;
  std::chrono::steady_clock::duration elapsed{};
  std::optional<long> status_code;
  std::optional<FailureOrigin> failure;
  std::string error;
  RetryDecision decision = RetryDecision::Terminal;
  std::optional<std::chrono::milliseconds> retry_delay;
};

// std::exception-derived errors thrown by the observer are logged and dropped;
// other types propagate to the caller of execute().
using AttemptObserver = std::function<void(const AttemptRecord&)>;

struct ExecutorOptions {
  RetryPolicy retry;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
  AttemptObserver attempt_observer;
  JitterSource jitter;
};

/**
 * Runs one logical call as a sequence of attempts against the transport,
 * sleeping between retryable failures on the caller's CallContext.
 *
 * Holds no mutable state after construction; concurrent execute() calls are
 * safe when the transport is.
 */
class RequestExecutor {
public:
  explicit RequestExecutor(ExecutorOptions options,
                           std::unique_ptr<HttpClient> http_client = nullptr);

  const RetryPolicy& policy() const { return options_.retry; }

  HttpResponse execute(const HttpRequest& request, const CallContext& context) const;

  HttpResponse execute(const HttpRequest& request,
                       std::size_t max_attempts,
                       std::chrono::milliseconds base_delay,
                       const CallContext& context) const;

private:
  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;
  void notify(const AttemptRecord& record) const;

  ExecutorOptions options_;
  BackoffCalculator backoff_;
  std::unique_ptr<HttpClient> http_client_;
};

}  // namespace upstream
