#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "upstream/backoff.hpp"
#include "upstream/call_context.hpp"
#include "upstream/error.hpp"
#include "upstream/executor.hpp"
#include "upstream/http_client.hpp"
#include "upstream/logging.hpp"
#include "upstream/utils/form.hpp"

namespace upstream {

using Headers = std::map<std::string, std::string>;
using FormValues = utils::form::Values;

struct ClientOptions {
  RetryPolicy retry;
  // Per-attempt transport timeout.
  std::chrono::milliseconds timeout{30000};
  Headers default_headers;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
  AttemptObserver attempt_observer;
  JitterSource jitter;
};

/**
 * Fills options still at their defaults from UPSTREAM_LOG,
 * UPSTREAM_MAX_ATTEMPTS, UPSTREAM_BASE_DELAY_MS, UPSTREAM_MAX_BACKOFF_MS and
 * UPSTREAM_TIMEOUT_MS.
 */
ClientOptions apply_environment(ClientOptions options);

/**
 * Convenience builders for calls to backend services. Each one assembles a
 * request and hands it to the RequestExecutor with the policy's attempt
 * budget; executor errors propagate unchanged.
 *
 * Header precedence, lowest first: Accept/User-Agent defaults,
 * ClientOptions::default_headers, the builder's content headers, `headers`.
 */
class UpstreamClient {
public:
  explicit UpstreamClient(ClientOptions options = {},
                          std::unique_ptr<HttpClient> http_client = nullptr);

  const ClientOptions& options() const { return options_; }
  const RequestExecutor& executor() const { return executor_; }

  std::string get(const CallContext& context, const std::string& url, const Headers& headers = {}) const;

  std::string post_json(const CallContext& context,
                        const std::string& url,
                        const nlohmann::json& payload,
                        const Headers& headers = {}) const;

  std::string post_form(const CallContext& context,
                        const std::string& url,
                        const FormValues& form,
                        const Headers& headers = {}) const;

  std::string put_json(const CallContext& context,
                       const std::string& url,
                       const nlohmann::json& payload,
                       const Headers& headers = {}) const;

  std::string patch_json(const CallContext& context,
                         const std::string& url,
                         const nlohmann::json& payload,
                         const Headers& headers = {}) const;

  std::string Delete(const CallContext& context, const std::string& url, const Headers& headers = {}) const;

private:
  HttpRequest build_request(const std::string& method,
                            const std::string& url,
                            std::string body,
                            const Headers& content_headers,
                            const Headers& headers) const;

  std::string send_json(const CallContext& context,
                        const std::string& method,
                        const std::string& url,
                        const nlohmann::json& payload,
                        const Headers& headers) const;

  std::string send(const CallContext& context, const HttpRequest& request) const;

  ClientOptions options_;
  RequestExecutor executor_;
};

}  // namespace upstream
