#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

namespace upstream {

inline constexpr std::chrono::milliseconds kDefaultMaxBackoff{30000};
inline constexpr double kMinJitterFactor = 0.8;
inline constexpr double kMaxJitterFactor = 1.2;

// Returns a multiplier for the nominal delay, expected in [0.8, 1.2].
using JitterSource = std::function<double()>;

/**
 * Uniform factor in [kMinJitterFactor, kMaxJitterFactor] drawn from a
 * thread-local generator.
 */
double default_jitter_factor();

/**
 * Delay before the retry that follows attempt `attempt` (0-based):
 * base * 2^attempt scaled by the jitter factor and clamped to [0, cap].
 * Does not sleep.
 */
std::chrono::milliseconds calculate_backoff(std::size_t attempt,
                                            std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap = kDefaultMaxBackoff,
                                            std::optional<double> jitter_factor = std::nullopt);

class BackoffCalculator {
public:
  explicit BackoffCalculator(std::chrono::milliseconds cap = kDefaultMaxBackoff,
                             JitterSource jitter = {});

  std::chrono::milliseconds delay(std::size_t attempt, std::chrono::milliseconds base) const;

  std::chrono::milliseconds cap() const { return cap_; }

private:
  std::chrono::milliseconds cap_;
  JitterSource jitter_;
};

}  // namespace upstream
