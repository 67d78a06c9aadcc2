#include <gtest/gtest.h>

#include "upstream/retry_classifier.hpp"

using upstream::FailureOrigin;
using upstream::RetryDecision;
using upstream::classify_failure;
using upstream::classify_status;
using upstream::is_retryable_status;
using upstream::is_success_status;
using upstream::should_retry;
using upstream::to_string;

TEST(RetryClassifierTest, SuccessStatusesAreNeverRetried) {
  for (long status = 200; status < 300; ++status) {
    EXPECT_TRUE(is_success_status(status)) << status;
    EXPECT_EQ(classify_status(status), RetryDecision::Success) << status;
  }
}

TEST(RetryClassifierTest, ServerErrorsAndThrottlingAreRetryable) {
  EXPECT_TRUE(is_retryable_status(429));
  EXPECT_TRUE(is_retryable_status(503));
  EXPECT_TRUE(is_retryable_status(504));
  for (long status = 500; status < 600; ++status) {
    EXPECT_TRUE(is_retryable_status(status)) << status;
    EXPECT_EQ(classify_status(status), RetryDecision::Retryable) << status;
  }
}

TEST(RetryClassifierTest, OtherNonSuccessStatusesAreTerminal) {
  for (long status = 100; status < 500; ++status) {
    if (is_success_status(status) || status == 429) {
      continue;
    }
    EXPECT_FALSE(is_retryable_status(status)) << status;
    EXPECT_EQ(classify_status(status), RetryDecision::Terminal) << status;
  }
}

TEST(RetryClassifierTest, TransportAndDecodeFailuresAreRetryable) {
  EXPECT_EQ(classify_failure(FailureOrigin::Transport), RetryDecision::Retryable);
  EXPECT_EQ(classify_failure(FailureOrigin::Decode), RetryDecision::Retryable);
}

TEST(RetryClassifierTest, CancellationIsTerminal) {
  EXPECT_EQ(classify_failure(FailureOrigin::Cancelled), RetryDecision::Terminal);
}

TEST(RetryClassifierTest, ShouldRetryHonoursAttemptBudget) {
  EXPECT_TRUE(should_retry(RetryDecision::Retryable, 0, 3));
  EXPECT_TRUE(should_retry(RetryDecision::Retryable, 1, 3));
  EXPECT_FALSE(should_retry(RetryDecision::Retryable, 2, 3));
  EXPECT_FALSE(should_retry(RetryDecision::Retryable, 0, 1));
  EXPECT_FALSE(should_retry(RetryDecision::Terminal, 0, 3));
  EXPECT_FALSE(should_retry(RetryDecision::Success, 0, 3));
}

TEST(RetryClassifierTest, DecisionNames) {
  EXPECT_STREQ(to_string(RetryDecision::Success), "success");
  EXPECT_STREQ(to_string(RetryDecision::Retryable), "retryable");
  EXPECT_STREQ(to_string(RetryDecision::Terminal), "terminal");
}
