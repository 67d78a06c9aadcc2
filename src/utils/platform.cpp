#include "upstream/utils/platform.hpp"

#include <string>

namespace upstream::utils {
namespace {

#ifdef UPSTREAM_CPP_VERSION
constexpr const char* kPackageVersion = UPSTREAM_CPP_VERSION;
#else
constexpr const char* kPackageVersion = "0.0.0-dev";
#endif

#if defined(__linux__)
constexpr const char* kOs = "Linux";
#elif defined(__APPLE__) && defined(__MACH__)
constexpr const char* kOs = "MacOS";
#elif defined(_WIN32)
constexpr const char* kOs = "Windows";
#elif defined(__FreeBSD__)
constexpr const char* kOs = "FreeBSD";
#else
constexpr const char* kOs = "Unknown";
#endif

#if defined(__x86_64__) || defined(_M_X64)
constexpr const char* kArch = "x64";
#elif defined(__aarch64__) || defined(_M_ARM64)
constexpr const char* kArch = "arm64";
#elif defined(__i386__) || defined(_M_IX86)
constexpr const char* kArch = "x32";
#elif defined(__arm__) || defined(_M_ARM)
constexpr const char* kArch = "arm";
#else
constexpr const char* kArch = "unknown";
#endif

std::string compiler_id() {
#if defined(__clang__)
  return "clang-" + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__);
#elif defined(__GNUC__)
  return "gcc-" + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__);
#elif defined(_MSC_VER)
  return "msvc-" + std::to_string(_MSC_VER);
#else
  return "unknown";
#endif
}

}  // namespace

const PlatformProperties& platform_properties() {
  static const PlatformProperties props{kPackageVersion, kOs, kArch, compiler_id()};
  return props;
}

std::string user_agent() {
  static const std::string agent = [] {
    const auto& props = platform_properties();
    return "upstream-cpp/" + props.package_version + " (" + props.os + "; " + props.arch + ")";
  }();
  return agent;
}

}  // namespace upstream::utils
