#include "upstream/client.hpp"

#include "upstream/utils/env.hpp"
#include "upstream/utils/platform.hpp"
#include "upstream/utils/values.hpp"

#include <utility>

namespace upstream {
namespace {

using json = nlohmann::json;

constexpr std::chrono::milliseconds kDefaultTimeout{30000};

// Replaces any existing header that differs from `key` only by case.
void set_header(Headers& headers, const std::string& key, const std::string& value) {
  for (auto it = headers.begin(); it != headers.end();) {
    if (utils::iequals(it->first, key)) {
      it = headers.erase(it);
    } else {
      ++it;
    }
  }
  headers[key] = value;
}

ExecutorOptions make_executor_options(const ClientOptions& options) {
  ExecutorOptions executor_options;
  executor_options.retry = options.retry;
  executor_options.log_level = options.log_level;
  executor_options.logger = options.logger;
  executor_options.attempt_observer = options.attempt_observer;
  executor_options.jitter = options.jitter;
  return executor_options;
}

}  // namespace

ClientOptions apply_environment(ClientOptions options) {
  const RetryPolicy defaults;

  if (options.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("UPSTREAM_LOG")) {
      if (!env_log->empty()) {
        options.log_level = parse_log_level(*env_log, options.log_level);
      }
    }
  }

  if (options.retry.max_attempts == defaults.max_attempts) {
    if (auto attempts = utils::read_env_integer("UPSTREAM_MAX_ATTEMPTS")) {
      options.retry.max_attempts = static_cast<std::size_t>(*attempts);
    }
  }
  if (options.retry.base_delay == defaults.base_delay) {
    if (auto base_delay = utils::read_env_milliseconds("UPSTREAM_BASE_DELAY_MS")) {
      options.retry.base_delay = *base_delay;
    }
  }
  if (options.retry.max_backoff == defaults.max_backoff) {
    if (auto max_backoff = utils::read_env_milliseconds("UPSTREAM_MAX_BACKOFF_MS")) {
      options.retry.max_backoff = *max_backoff;
    }
  }
  if (options.timeout == kDefaultTimeout) {
    if (auto timeout = utils::read_env_milliseconds("UPSTREAM_TIMEOUT_MS")) {
      options.timeout = *timeout;
    }
  }

  utils::validate_positive_integer("ClientOptions.timeout", options.timeout.count());
  return options;
}

UpstreamClient::UpstreamClient(ClientOptions options, std::unique_ptr<HttpClient> http_client)
    : options_(apply_environment(std::move(options))),
      executor_(make_executor_options(options_), std::move(http_client)) {}

HttpRequest UpstreamClient::build_request(const std::string& method,
                                          const std::string& url,
                                          std::string body,
                                          const Headers& content_headers,
                                          const Headers& headers) const {
  HttpRequest request;
  request.method = method;
  request.url = url;
  request.body = std::move(body);
  request.timeout = options_.timeout;

  Headers merged;
  merged["Accept"] = "application/json";
  merged["User-Agent"] = utils::user_agent();
  for (const auto& [key, value] : options_.default_headers) {
    set_header(merged, key, value);
  }
  for (const auto& [key, value] : content_headers) {
    set_header(merged, key, value);
  }
  for (const auto& [key, value] : headers) {
    set_header(merged, key, value);
  }
  request.headers = std::move(merged);
  return request;
}

std::string UpstreamClient::send(const CallContext& context, const HttpRequest& request) const {
  return executor_.execute(request, context).body;
}

std::string UpstreamClient::send_json(const CallContext& context,
                                      const std::string& method,
                                      const std::string& url,
                                      const nlohmann::json& payload,
                                      const Headers& headers) const {
  std::string body;
  try {
    body = payload.dump();
  } catch (const json::exception& ex) {
    throw UpstreamError(std::string("Failed to encode JSON payload: ") + ex.what());
  }
  return send(context, build_request(method, url, std::move(body), {{"Content-Type", "application/json"}}, headers));
}

std::string UpstreamClient::get(const CallContext& context, const std::string& url, const Headers& headers) const {
  return send(context, build_request("GET", url, {}, {}, headers));
}

std::string UpstreamClient::post_json(const CallContext& context,
                                      const std::string& url,
                                      const nlohmann::json& payload,
                                      const Headers& headers) const {
  return send_json(context, "POST", url, payload, headers);
}

std::string UpstreamClient::post_form(const CallContext& context,
                                      const std::string& url,
                                      const FormValues& form,
                                      const Headers& headers) const {
  std::string body = utils::form::encode(form);
  Headers content_headers{
      {"Content-Type", "application/x-www-form-urlencoded"},
      {"Content-Length", std::to_string(body.size())},
  };
  return send(context, build_request("POST", url, std::move(body), content_headers, headers));
}

std::string UpstreamClient::put_json(const CallContext& context,
                                     const std::string& url,
                                     const nlohmann::json& payload,
                                     const Headers& headers) const {
  return send_json(context, "PUT", url, payload, headers);
}

std::string UpstreamClient::patch_json(const CallContext& context,
                                       const std::string& url,
                                       const nlohmann::json& payload,
                                       const Headers& headers) const {
  return send_json(context, "PATCH", url, payload, headers);
}

std::string UpstreamClient::Delete(const CallContext& context, const std::string& url, const Headers& headers) const {
  return send(context, build_request("DELETE", url, {}, {}, headers));
}

}  // namespace upstream
