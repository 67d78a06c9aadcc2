#include "upstream/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace upstream {
namespace {

// 0.8 * 2^64 ms is beyond any representable cap.
constexpr std::size_t kMaxExponent = 64;

}  // namespace

double default_jitter_factor() {
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_real_distribution<double> dist(kMinJitterFactor, kMaxJitterFactor);
  return dist(rng);
}

std::chrono::milliseconds calculate_backoff(std::size_t attempt,
                                            std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap,
                                            std::optional<double> jitter_factor) {
  if (base.count() <= 0 || cap.count() <= 0) {
    return std::chrono::milliseconds(0);
  }

  const double cap_ms = static_cast<double>(cap.count());
  const double base_ms = static_cast<double>(base.count());

  // Even the smallest jittered delay would be clamped.
  if (attempt >= kMaxExponent || base_ms * std::ldexp(kMinJitterFactor, static_cast<int>(attempt)) >= cap_ms) {
    return cap;
  }

  double jitter = jitter_factor.value_or(default_jitter_factor());
  // std::clamp passes NaN through unchanged.
  if (std::isnan(jitter)) {
    jitter = default_jitter_factor();
  }
  jitter = std::clamp(jitter, kMinJitterFactor, kMaxJitterFactor);

  const double delay_ms = base_ms * std::ldexp(1.0, static_cast<int>(attempt)) * jitter;
  if (delay_ms >= cap_ms) {
    return cap;
  }
  const auto rounded = static_cast<std::chrono::milliseconds::rep>(std::llround(delay_ms));
  return std::chrono::milliseconds(std::max<std::chrono::milliseconds::rep>(rounded, 0));
}

BackoffCalculator::BackoffCalculator(std::chrono::milliseconds cap, JitterSource jitter)
    : cap_(cap), jitter_(std::move(jitter)) {}

std::chrono::milliseconds BackoffCalculator::delay(std::size_t attempt, std::chrono::milliseconds base) const {
  std::optional<double> factor;
  if (jitter_) {
    factor = jitter_();
  }
  return calculate_backoff(attempt, base, cap_, factor);
}

}  // namespace upstream
