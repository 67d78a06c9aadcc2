#include <gtest/gtest.h>

#include <chrono>

#include "upstream/error.hpp"
#include "upstream/utils/env.hpp"

#include "support/env_guard.hpp"

using upstream::utils::read_env;
using upstream::utils::read_env_integer;
using upstream::utils::read_env_milliseconds;

namespace testing_utils = upstream::testing;

TEST(UtilsEnvTest, ReturnsNulloptWhenUnset) {
  testing_utils::ScopedEnvVar guard("UPSTREAM_CPP_TEST_ENV_UNSET", std::nullopt);
  EXPECT_FALSE(read_env("UPSTREAM_CPP_TEST_ENV_UNSET").has_value());
}

TEST(UtilsEnvTest, TrimsWhitespaceFromValues) {
  testing_utils::ScopedEnvVar guard("UPSTREAM_CPP_TEST_ENV_TRIM", std::string("  value  "));
  auto value = read_env("UPSTREAM_CPP_TEST_ENV_TRIM");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "value");
}

TEST(UtilsEnvTest, ReadsIntegers) {
  testing_utils::ScopedEnvVar guard("UPSTREAM_CPP_TEST_ENV_INT", std::string(" 17 "));
  EXPECT_EQ(read_env_integer("UPSTREAM_CPP_TEST_ENV_INT"), 17);
  EXPECT_EQ(read_env_milliseconds("UPSTREAM_CPP_TEST_ENV_INT"), std::chrono::milliseconds(17));
}

TEST(UtilsEnvTest, BlankIntegerIsUnset) {
  testing_utils::ScopedEnvVar guard("UPSTREAM_CPP_TEST_ENV_BLANK", std::string("   "));
  EXPECT_FALSE(read_env_integer("UPSTREAM_CPP_TEST_ENV_BLANK").has_value());
}

TEST(UtilsEnvTest, RejectsInvalidIntegers) {
  testing_utils::ScopedEnvVar negative("UPSTREAM_CPP_TEST_ENV_NEG", std::string("-1"));
  testing_utils::ScopedEnvVar junk("UPSTREAM_CPP_TEST_ENV_JUNK", std::string("ten"));
  EXPECT_THROW(read_env_integer("UPSTREAM_CPP_TEST_ENV_NEG"), upstream::UpstreamError);
  EXPECT_THROW(read_env_milliseconds("UPSTREAM_CPP_TEST_ENV_JUNK"), upstream::UpstreamError);
}
