#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>

#include "upstream/backoff.hpp"

using std::chrono::milliseconds;
using upstream::BackoffCalculator;
using upstream::calculate_backoff;
using upstream::default_jitter_factor;

TEST(BackoffTest, FirstAttemptUsesBaseDelayScaledByJitterOnly) {
  EXPECT_EQ(calculate_backoff(0, milliseconds(1000), milliseconds(30000), 1.0), milliseconds(1000));
  EXPECT_EQ(calculate_backoff(0, milliseconds(1000), milliseconds(30000), 0.8), milliseconds(800));
  EXPECT_EQ(calculate_backoff(0, milliseconds(1000), milliseconds(30000), 1.2), milliseconds(1200));
}

TEST(BackoffTest, DoublesPerAttempt) {
  EXPECT_EQ(calculate_backoff(1, milliseconds(100), milliseconds(30000), 1.0), milliseconds(200));
  EXPECT_EQ(calculate_backoff(2, milliseconds(100), milliseconds(30000), 1.0), milliseconds(400));
  EXPECT_EQ(calculate_backoff(5, milliseconds(100), milliseconds(30000), 1.0), milliseconds(3200));
}

TEST(BackoffTest, ClampsToCap) {
  EXPECT_EQ(calculate_backoff(5, milliseconds(1000), milliseconds(30000), 1.0), milliseconds(30000));
  EXPECT_EQ(calculate_backoff(4, milliseconds(1000), milliseconds(30000), 1.2), milliseconds(19200));
  EXPECT_EQ(calculate_backoff(4, milliseconds(2000), milliseconds(30000), 1.2), milliseconds(30000));
}

TEST(BackoffTest, HugeAttemptIndexDoesNotOverflow) {
  EXPECT_EQ(calculate_backoff(63, milliseconds(1), milliseconds(30000), 1.0), milliseconds(30000));
  EXPECT_EQ(calculate_backoff(64, milliseconds(1), milliseconds(30000), 1.0), milliseconds(30000));
  EXPECT_EQ(calculate_backoff(std::numeric_limits<std::size_t>::max(), milliseconds(1000)), milliseconds(30000));
}

TEST(BackoffTest, NonPositiveBaseYieldsZero) {
  EXPECT_EQ(calculate_backoff(3, milliseconds(0), milliseconds(30000), 1.0), milliseconds(0));
  EXPECT_EQ(calculate_backoff(3, milliseconds(-5), milliseconds(30000), 1.0), milliseconds(0));
}

TEST(BackoffTest, OutOfRangeJitterIsClamped) {
  EXPECT_EQ(calculate_backoff(0, milliseconds(1000), milliseconds(30000), 5.0), milliseconds(1200));
  EXPECT_EQ(calculate_backoff(0, milliseconds(1000), milliseconds(30000), -1.0), milliseconds(800));
}

TEST(BackoffTest, RandomDelaysStayWithinJitterBand) {
  const milliseconds cap(30000);
  for (std::size_t attempt = 0; attempt < 8; ++attempt) {
    for (long base_ms : {1L, 7L, 100L, 1000L}) {
      for (int sample = 0; sample < 25; ++sample) {
        const auto delay = calculate_backoff(attempt, milliseconds(base_ms), cap);
        const double nominal = static_cast<double>(base_ms) * std::ldexp(1.0, static_cast<int>(attempt));
        const double low = std::min(0.8 * nominal, static_cast<double>(cap.count()));
        const double high = std::min(1.2 * nominal, static_cast<double>(cap.count()));
        // Results are rounded to whole milliseconds.
        EXPECT_GE(static_cast<double>(delay.count()), std::floor(low) - 1.0)
            << "attempt=" << attempt << " base=" << base_ms;
        EXPECT_LE(static_cast<double>(delay.count()), std::ceil(high) + 1.0)
            << "attempt=" << attempt << " base=" << base_ms;
        EXPECT_GE(delay.count(), 0);
      }
    }
  }
}

TEST(BackoffTest, DefaultJitterFactorWithinRange) {
  for (int i = 0; i < 100; ++i) {
    double jitter = default_jitter_factor();
    EXPECT_GE(jitter, 0.8);
    EXPECT_LE(jitter, 1.2);
  }
}

TEST(BackoffCalculatorTest, UsesInjectedJitterSource) {
  int calls = 0;
  BackoffCalculator calculator(milliseconds(10000), [&calls] {
    ++calls;
    return 0.9;
  });

  EXPECT_EQ(calculator.delay(0, milliseconds(100)), milliseconds(90));
  EXPECT_EQ(calculator.delay(3, milliseconds(100)), milliseconds(720));
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(calculator.cap(), milliseconds(10000));
}

TEST(BackoffCalculatorTest, RespectsConfiguredCap) {
  BackoffCalculator calculator(milliseconds(250), [] { return 1.0; });
  EXPECT_EQ(calculator.delay(0, milliseconds(100)), milliseconds(100));
  EXPECT_EQ(calculator.delay(1, milliseconds(100)), milliseconds(200));
  EXPECT_EQ(calculator.delay(2, milliseconds(100)), milliseconds(250));
}

TEST(BackoffCalculatorTest, NonFiniteJitterStaysWithinBand) {
  BackoffCalculator nan_source(milliseconds(30000), [] { return std::numeric_limits<double>::quiet_NaN(); });
  for (int i = 0; i < 20; ++i) {
    const auto delay = nan_source.delay(1, milliseconds(1000));
    EXPECT_GE(delay, milliseconds(1600));
    EXPECT_LE(delay, milliseconds(2400));
  }

  BackoffCalculator inf_source(milliseconds(30000), [] { return std::numeric_limits<double>::infinity(); });
  EXPECT_EQ(inf_source.delay(1, milliseconds(1000)), milliseconds(2400));
}
