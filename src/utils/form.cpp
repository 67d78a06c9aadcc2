#include "upstream/utils/form.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace upstream::utils::form {
namespace {

bool is_unreserved(unsigned char c) {
  if (std::isalnum(c) != 0) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
      return true;
    default:
      return false;
  }
}

}  // namespace

std::string escape(std::string_view input) {
  if (input.empty()) {
    return {};
  }

  std::ostringstream encoded;
  encoded << std::uppercase << std::hex;

  for (unsigned char byte : input) {
    if (is_unreserved(byte)) {
      encoded << static_cast<char>(byte);
      continue;
    }
    if (byte == ' ') {
      encoded << '+';
      continue;
    }

    encoded << '%';
    encoded << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }

  return encoded.str();
}

std::string encode(const Values& values) {
  std::string result;
  for (const auto& [key, entries] : values) {
    const std::string escaped_key = escape(key);
    for (const auto& value : entries) {
      if (!result.empty()) {
        result.push_back('&');
      }
      result += escaped_key;
      result.push_back('=');
      result += escape(value);
    }
  }
  return result;
}

}  // namespace upstream::utils::form
