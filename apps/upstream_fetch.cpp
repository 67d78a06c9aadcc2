#include "upstream/client.hpp"
#include "upstream/utils/env.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>

namespace {

void print_usage(const char* program) {
  std::cerr << "usage: " << program << " <GET|POST|PUT|PATCH|DELETE> <URL> [JSON_BODY]\n"
            << "\n"
            << "environment:\n"
            << "  UPSTREAM_LOG             off|error|warn|info|debug\n"
            << "  UPSTREAM_MAX_ATTEMPTS    attempts per call (default 3)\n"
            << "  UPSTREAM_BASE_DELAY_MS   first backoff delay (default 1000)\n"
            << "  UPSTREAM_MAX_BACKOFF_MS  backoff cap (default 30000)\n"
            << "  UPSTREAM_TIMEOUT_MS      per-attempt timeout (default 30000)\n"
            << "  UPSTREAM_DEADLINE_MS     deadline for the whole call\n";
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc < 3 || argc > 4)
  {
    print_usage(argv[0]);
    return 2;
  }

  const std::string method = to_upper(argv[1]);
  const std::string url = argv[2];
  const std::string body = argc == 4 ? argv[3] : "";

  try
  {
    upstream::ClientOptions options;
    options.log_level = upstream::LogLevel::Warn;
    options.logger = [](upstream::LogLevel level, const std::string& message, const nlohmann::json& details)
    {
      std::cerr << "[" << upstream::to_string(level) << "] " << message << " " << details.dump() << std::endl;
    };

    upstream::UpstreamClient client(options);

    std::unique_ptr<upstream::CallContext> context;
    if (auto deadline = upstream::utils::read_env_milliseconds("UPSTREAM_DEADLINE_MS"))
    {
      context = std::make_unique<upstream::CallContext>(upstream::CallContext::Clock::now() + *deadline);
    }
    else
    {
      context = std::make_unique<upstream::CallContext>();
    }

    nlohmann::json payload;
    if (!body.empty())
    {
      payload = nlohmann::json::parse(body);
    }

    std::string result;
    if (method == "GET")
    {
      result = client.get(*context, url);
    }
    else if (method == "POST")
    {
      result = client.post_json(*context, url, payload);
    }
    else if (method == "PUT")
    {
      result = client.put_json(*context, url, payload);
    }
    else if (method == "PATCH")
    {
      result = client.patch_json(*context, url, payload);
    }
    else if (method == "DELETE")
    {
      result = client.Delete(*context, url);
    }
    else
    {
      print_usage(argv[0]);
      return 2;
    }

    std::cout << result << std::endl;
  }
  catch (const upstream::RequestError &ex)
  {
    std::cerr << "Request failed (" << upstream::to_string(ex.origin()) << ", " << ex.attempts()
              << " attempt(s)): " << ex.cause() << std::endl;
    if (ex.status_code())
    {
      std::cerr << "Status: " << *ex.status_code() << std::endl;
    }
    if (!ex.body().empty())
    {
      std::cerr << "Body: " << ex.body() << std::endl;
    }
    return 1;
  }
  catch (const nlohmann::json::exception &ex)
  {
    std::cerr << "Invalid JSON body: " << ex.what() << std::endl;
    return 2;
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }

  return 0;
}
