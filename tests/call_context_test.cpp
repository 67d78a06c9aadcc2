#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "upstream/call_context.hpp"
#include "upstream/error.hpp"

using namespace std::chrono_literals;
using upstream::CallContext;

TEST(CallContextTest, FreshContextIsNotDone) {
  CallContext context;
  EXPECT_FALSE(context.is_cancelled());
  EXPECT_FALSE(context.deadline_exceeded());
  EXPECT_FALSE(context.done());
  EXPECT_FALSE(context.remaining().has_value());
  EXPECT_NO_THROW(context.check());
}

TEST(CallContextTest, WaitForElapsesWhenNotCancelled) {
  CallContext context;
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(context.wait_for(20ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(CallContextTest, ZeroWaitReturnsImmediately) {
  CallContext context;
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(context.wait_for(0ms));
  EXPECT_LE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(CallContextTest, CancelWakesPendingWait) {
  CallContext context;
  std::thread canceller([&context] {
    std::this_thread::sleep_for(30ms);
    context.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(context.wait_for(10s));
  auto waited = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_LT(waited, 2s);
  EXPECT_TRUE(context.is_cancelled());
  EXPECT_THROW(context.check(), upstream::CancelledError);
}

TEST(CallContextTest, DeadlineCutsWaitShort) {
  auto context = CallContext::with_timeout(30ms);
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(context.wait_for(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_TRUE(context.deadline_exceeded());
  EXPECT_TRUE(context.done());
  EXPECT_FALSE(context.is_cancelled());
  EXPECT_THROW(context.check(), upstream::DeadlineExceededError);
}

TEST(CallContextTest, RemainingShrinksAndFloorsAtZero) {
  auto context = CallContext::with_timeout(200ms);
  auto remaining = context.remaining();
  ASSERT_TRUE(remaining.has_value());
  EXPECT_LE(*remaining, 200ms);
  EXPECT_GT(*remaining, 0ms);

  CallContext expired(CallContext::Clock::now() - 1s);
  ASSERT_TRUE(expired.remaining().has_value());
  EXPECT_EQ(*expired.remaining(), 0ms);
  EXPECT_TRUE(expired.done());
}

TEST(CallContextTest, CancelledTakesPrecedenceOverDeadline) {
  CallContext context(CallContext::Clock::now() - 1s);
  context.cancel();
  try {
    context.check();
    FAIL() << "Expected CancelledError";
  } catch (const upstream::DeadlineExceededError&) {
    FAIL() << "Expected plain CancelledError";
  } catch (const upstream::CancelledError& err) {
    EXPECT_EQ(err.origin(), upstream::FailureOrigin::Cancelled);
  }
}
