#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace upstream {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};
  // Polled while the transfer is in flight; returning true aborts it.
  std::function<bool()> abort_requested;
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * Sends one request and reads the whole response body.
 *
 * Implementations throw TransportError when no response was obtained,
 * DecodeError when the body could not be read to completion, and
 * CancelledError when abort_requested() stopped the transfer. Any status
 * code is returned as a response, never thrown.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

inline constexpr int kMaxRedirects = 10;

struct RedirectHop {
  std::string method;
  bool keep_body = false;
};

/**
 * How the request is re-sent after a redirect status. 301, 302 and 303 turn
 * anything but GET and HEAD into a bodiless GET; 307 and 308 repeat the
 * method and body. Returns std::nullopt for statuses that are not followed.
 */
std::optional<RedirectHop> redirect_hop(const std::string& method, long status);

std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace upstream
