#include "upstream/http_client.hpp"

#include "upstream/error.hpp"
#include "upstream/utils/platform.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace upstream {
namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  const size_t total = size * nmemb;
  body->append(ptr, total);
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  // A new status line starts the header block of a redirect target.
  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
    return total_size;
  }
  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);

    auto trim = [](std::string& s) {
      auto not_space = [](unsigned char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
      s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
      s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    };

    trim(key);
    trim(value);
    if (!key.empty()) {
      (*headers)[key] = value;
    }
  }

  return total_size;
}

int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* abort_requested = static_cast<const std::function<bool()>*>(clientp);
  return (*abort_requested)() ? 1 : 0;
}

bool is_body_read_failure(CURLcode code) {
  switch (code) {
    case CURLE_RECV_ERROR:
    case CURLE_PARTIAL_FILE:
    case CURLE_WRITE_ERROR:
    case CURLE_BAD_CONTENT_ENCODING:
    case CURLE_GOT_NOTHING:
      return true;
    default:
      return false;
  }
}

bool method_sends_body(const std::string& method) {
  return method == "POST" || method == "PUT" || method == "PATCH";
}

struct CurlUrlDeleter {
  void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

std::string url_host(const std::string& url) {
  std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
  if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
    return {};
  }
  char* host = nullptr;
  if (curl_url_get(handle.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK || !host) {
    return {};
  }
  std::string result(host);
  curl_free(host);
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

// Credentials follow a redirect only to the same host or one of its subdomains.
bool forwards_credentials(const std::string& from_host, const std::string& to_host) {
  if (from_host.empty() || to_host.empty()) {
    return false;
  }
  if (from_host == to_host) {
    return true;
  }
  return to_host.size() > from_host.size() &&
         to_host.compare(to_host.size() - from_host.size(), from_host.size(), from_host) == 0 &&
         to_host[to_host.size() - from_host.size() - 1] == '.';
}

void erase_headers(std::map<std::string, std::string>& headers, std::initializer_list<const char*> names) {
  for (auto it = headers.begin(); it != headers.end();) {
    const bool matched = std::any_of(names.begin(), names.end(), [&it](const char* name) {
      const std::string candidate(name);
      return candidate.size() == it->first.size() &&
             std::equal(candidate.begin(), candidate.end(), it->first.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
             });
    });
    it = matched ? headers.erase(it) : std::next(it);
  }
}

struct Transfer {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string redirect_url;
};

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  // libcurl's own redirect handling repeats a custom method on every hop, so
  // redirects are followed here, one transfer per hop.
  HttpResponse request(const HttpRequest& request) override {
    const auto give_up = std::chrono::steady_clock::now() + request.timeout;
    const std::string origin_host = url_host(request.url);

    HttpRequest hop = request;
    for (int redirects = 0;; ++redirects) {
      const auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(give_up - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        throw TransportTimeoutError("libcurl error: timeout reached while following redirects");
      }
      hop.timeout = left;

      Transfer transfer = perform(hop);
      const auto next = redirect_hop(hop.method, transfer.status_code);
      if (!next || transfer.redirect_url.empty()) {
        return HttpResponse{transfer.status_code, std::move(transfer.headers), std::move(transfer.body)};
      }
      if (redirects >= kMaxRedirects) {
        throw TransportError("stopped after " + std::to_string(kMaxRedirects) + " redirects");
      }

      hop.url = transfer.redirect_url;
      hop.method = next->method;
      if (!next->keep_body) {
        hop.body.clear();
        erase_headers(hop.headers, {"Content-Type", "Content-Length"});
      }
      if (!forwards_credentials(origin_host, url_host(hop.url))) {
        erase_headers(hop.headers, {"Authorization", "WWW-Authenticate", "Cookie", "Cookie2"});
      }
    }
  }

private:
  static Transfer perform(const HttpRequest& request) {
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
      throw TransportError("Failed to initialize libcurl");
    }

    CurlSlistPtr header_list;
    for (const auto& [key, value] : request.headers) {
      // "Name;" is how libcurl sends a header with an empty value.
      std::string header = value.empty() ? key + ";" : key + ": " + value;
      curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
      if (!appended) {
        throw TransportError("Failed to build request headers");
      }
      header_list.release();
      header_list.reset(appended);
    }

    Transfer transfer;

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (request.method == "HEAD") {
      curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &transfer.body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &transfer.headers);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_USERAGENT, utils::user_agent().c_str());

    if (request.abort_requested) {
      curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
      curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
      curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &request.abort_requested);
    } else {
      curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 1L);
    }

    if (!request.body.empty() || method_sends_body(request.method)) {
      curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(handle);

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &transfer.status_code);

    if (res != CURLE_OK) {
      std::string message = std::string("libcurl error: ") + curl_easy_strerror(res);
      if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw CancelledError("request aborted");
      }
      if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TransportTimeoutError(message);
      }
      if (transfer.status_code > 0 && is_body_read_failure(res)) {
        throw DecodeError(message, transfer.status_code);
      }
      throw TransportError(message);
    }

    char* redirect_url = nullptr;
    if (curl_easy_getinfo(handle, CURLINFO_REDIRECT_URL, &redirect_url) == CURLE_OK && redirect_url) {
      transfer.redirect_url = redirect_url;
    }
    return transfer;
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::optional<RedirectHop> redirect_hop(const std::string& method, long status) {
  switch (status) {
    case 301:
    case 302:
    case 303:
      if (method == "GET" || method == "HEAD") {
        return RedirectHop{method, false};
      }
      return RedirectHop{"GET", false};
    case 307:
    case 308:
      return RedirectHop{method, true};
    default:
      return std::nullopt;
  }
}

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace upstream
