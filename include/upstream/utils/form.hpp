#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace upstream::utils::form {

// Field name -> values, in the order they are sent.
using Values = std::map<std::string, std::vector<std::string>>;

/**
 * Escapes one key or value for application/x-www-form-urlencoded:
 * unreserved bytes pass through, space becomes '+', the rest is %XX.
 */
[[nodiscard]] std::string escape(std::string_view input);

/**
 * "k1=v1&k1=v2&k2=v3", keys in sorted order. A key with no values is
 * omitted.
 */
[[nodiscard]] std::string encode(const Values& values);

}  // namespace upstream::utils::form
