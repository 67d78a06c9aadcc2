#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "upstream/error.hpp"

namespace upstream::utils {

template <typename Integer,
          typename = std::enable_if_t<std::is_integral_v<Integer>>>
Integer validate_positive_integer(const std::string& name, Integer value) {
  if (value <= 0) {
    throw UpstreamError(name + " must be a positive integer");
  }
  return value;
}

// Whole-string base-10 parse; nullopt on junk, overflow or empty input.
std::optional<std::int64_t> parse_integer(std::string_view text);

bool iequals(std::string_view lhs, std::string_view rhs);

}  // namespace upstream::utils
