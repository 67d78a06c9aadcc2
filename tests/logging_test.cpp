#include <gtest/gtest.h>

#include "upstream/logging.hpp"

using upstream::LogLevel;
using upstream::parse_log_level;

TEST(LoggingTest, ParsesLevelsIgnoringCase) {
  EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level("INFO"), LogLevel::Info);
  EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
  EXPECT_EQ(parse_log_level("none"), LogLevel::Off);
}

TEST(LoggingTest, UnknownLevelUsesFallback) {
  EXPECT_EQ(parse_log_level("loud"), LogLevel::Off);
  EXPECT_EQ(parse_log_level("loud", LogLevel::Warn), LogLevel::Warn);
}

TEST(LoggingTest, LevelNamesRoundTrip) {
  for (auto level : {LogLevel::Off, LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug}) {
    EXPECT_EQ(parse_log_level(upstream::to_string(level), LogLevel::Debug), level);
  }
}
