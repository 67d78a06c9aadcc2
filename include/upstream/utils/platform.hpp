#pragma once

#include <string>

namespace upstream::utils {

struct PlatformProperties {
  std::string package_version;
  std::string os;
  std::string arch;
  std::string compiler;
};

/**
 * Returns cached properties of the build and host platform.
 */
const PlatformProperties& platform_properties();

/**
 * Default User-Agent sent on every upstream request, e.g.
 * "upstream-cpp/0.1.0 (Linux; x64)".
 */
std::string user_agent();

}  // namespace upstream::utils
