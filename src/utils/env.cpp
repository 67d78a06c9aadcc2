#include "upstream/utils/env.hpp"

#include "upstream/error.hpp"
#include "upstream/utils/values.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace upstream::utils {
namespace {

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  return trim(raw);
}

std::optional<std::int64_t> read_env_integer(const std::string& name) {
  auto raw = read_env(name);
  if (!raw || raw->empty()) {
    return std::nullopt;
  }
  auto parsed = parse_integer(*raw);
  if (!parsed || *parsed < 0) {
    throw UpstreamError(name + " must be a non-negative integer, got \"" + *raw + "\"");
  }
  return parsed;
}

std::optional<std::chrono::milliseconds> read_env_milliseconds(const std::string& name) {
  if (auto value = read_env_integer(name)) {
    return std::chrono::milliseconds(*value);
  }
  return std::nullopt;
}

}  // namespace upstream::utils
