#include <gtest/gtest.h>

#include "cancel_token.hpp"
#include "rate_limiter.hpp"

#include <chrono>
#include <thread>

using namespace linebridge;

class RateLimiterTest : public ::testing::Test {};

TEST_F(RateLimiterTest, BurstIsAdmittedImmediately) {
  TokenBucketLimiter limiter(1.0, 3);
  EXPECT_TRUE(limiter.Allow());
  EXPECT_TRUE(limiter.Allow());
  EXPECT_TRUE(limiter.Allow());
  EXPECT_FALSE(limiter.Allow());
  auto m = limiter.Metrics();
  EXPECT_EQ(m["allowed"], 3);
  EXPECT_EQ(m["rejected"], 1);
}

TEST_F(RateLimiterTest, TokensRefillOverTime) {
  TokenBucketLimiter limiter(20.0, 1);
  EXPECT_TRUE(limiter.Allow());
  EXPECT_FALSE(limiter.Allow());
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  EXPECT_TRUE(limiter.Allow());
}

TEST_F(RateLimiterTest, WaitBlocksUntilRefill) {
  TokenBucketLimiter limiter(10.0, 1);
  ASSERT_TRUE(limiter.Allow());
  CancelToken cancel(std::chrono::seconds(2));
  std::string err;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(limiter.Wait(&cancel, &err));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST_F(RateLimiterTest, WaitGivesUpAtDeadline) {
  TokenBucketLimiter limiter(0.01, 1);
  ASSERT_TRUE(limiter.Allow());
  CancelToken cancel(std::chrono::milliseconds(60));
  std::string err;
  EXPECT_FALSE(limiter.Wait(&cancel, &err));
  EXPECT_EQ(err, "context deadline exceeded");
}

TEST_F(RateLimiterTest, UnlimitedNeverBlocks) {
  UnlimitedRateLimiter limiter;
  for (int i = 0; i < 100; i++) EXPECT_TRUE(limiter.Allow());
  EXPECT_TRUE(limiter.Wait(nullptr, nullptr));
}

TEST_F(RateLimiterTest, CancelTokenReasons) {
  CancelToken plain;
  EXPECT_FALSE(plain.IsCancelled());
  plain.Cancel();
  EXPECT_TRUE(plain.IsCancelled());
  EXPECT_EQ(plain.Reason(), "context canceled");

  CancelToken deadline(std::chrono::milliseconds(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  EXPECT_TRUE(deadline.IsCancelled());
  EXPECT_EQ(deadline.Reason(), "context deadline exceeded");
}

TEST_F(RateLimiterTest, CancelTokenLivenessProbe) {
  bool alive = true;
  CancelToken token;
  token.SetLivenessProbe([&alive] { return alive; });
  EXPECT_FALSE(token.IsCancelled());
  alive = false;
  EXPECT_TRUE(token.IsCancelled());
  EXPECT_EQ(token.Reason(), "context canceled");
}

TEST_F(RateLimiterTest, CancelInterruptsSleep) {
  CancelToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token.Cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.SleepFor(std::chrono::seconds(5)));
  canceller.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
  CancelToken idle;
  EXPECT_TRUE(idle.SleepFor(std::chrono::milliseconds(5)));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
