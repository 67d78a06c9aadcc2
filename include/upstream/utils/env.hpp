#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace upstream::utils {

/**
 * Reads an environment variable and trims leading/trailing whitespace.
 * Returns std::nullopt when the variable is not set.
 */
std::optional<std::string> read_env(const std::string& name);

/**
 * Reads a non-negative integer. Unset or blank variables yield std::nullopt;
 * anything that is not a non-negative integer throws UpstreamError.
 */
std::optional<std::int64_t> read_env_integer(const std::string& name);

std::optional<std::chrono::milliseconds> read_env_milliseconds(const std::string& name);

}  // namespace upstream::utils
