#include "taskq/worker/retry_policy.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace taskq;
using namespace std::chrono_literals;

namespace {

auto no_jitter(std::chrono::milliseconds base, std::chrono::milliseconds cap)
    -> RetryPolicy {
  return RetryPolicy(RetryOptions{base, cap, 0.0});
}

}  // namespace

TEST(RetryPolicyTest, BackoffDoublesFromBase) {
  auto policy = no_jitter(100ms, 1h);

  EXPECT_EQ(policy.backoff(0), 100ms);
  EXPECT_EQ(policy.backoff(1), 200ms);
  EXPECT_EQ(policy.backoff(2), 400ms);
  EXPECT_EQ(policy.backoff(5), 3200ms);
}

TEST(RetryPolicyTest, BackoffIsCapped) {
  auto policy = no_jitter(1s, 10s);

  EXPECT_EQ(policy.backoff(3), 8s);
  EXPECT_EQ(policy.backoff(4), 10s);
  EXPECT_EQ(policy.backoff(200), 10s);
}

TEST(RetryPolicyTest, NegativeRetryCountUsesBase) {
  auto policy = no_jitter(250ms, 10s);

  EXPECT_EQ(policy.backoff(-3), 250ms);
}

TEST(RetryPolicyTest, JitterStaysWithinBounds) {
  RetryPolicy policy(RetryOptions{1s, 1h, 0.5});

  for (int i = 0; i < 200; ++i) {
    auto d = policy.backoff(1);
    EXPECT_GE(d, 2s);
    EXPECT_LE(d, 3s);
  }
}

TEST(RetryPolicyTest, JitterNeverExceedsCap) {
  RetryPolicy policy(RetryOptions{1s, 5s, 1.0});

  for (int i = 0; i < 200; ++i) {
    EXPECT_LE(policy.backoff(10), 5s);
  }
}

TEST(RetryPolicyTest, TransientErrorRetriesWithIncrementedCount) {
  auto policy = no_jitter(100ms, 1h);
  auto task = test::make_task("default", "test:noop", 3);
  task.retry_count = 1;

  auto d = policy.decide(task, TaskError::transient("boom"));

  EXPECT_TRUE(d.retry());
  EXPECT_EQ(d.next_retry_count, 2);
  EXPECT_EQ(d.delay, 200ms);
}

TEST(RetryPolicyTest, SkipRetryFailsImmediately) {
  auto policy = no_jitter(100ms, 1h);
  auto task = test::make_task("default", "test:noop", 3);

  auto d = policy.decide(task, TaskError::validation("bad input"));

  EXPECT_FALSE(d.retry());
  EXPECT_EQ(d.next_retry_count, 0);
}

TEST(RetryPolicyTest, RetryBudgetSpentFails) {
  auto policy = no_jitter(100ms, 1h);
  auto task = test::make_task("default", "test:noop", 3);
  task.retry_count = 3;

  auto d = policy.decide(task, TaskError::transient("boom"));

  EXPECT_FALSE(d.retry());
  EXPECT_EQ(d.next_retry_count, 3);
}

TEST(RetryPolicyTest, ZeroMaxRetryNeverRetries) {
  auto policy = no_jitter(100ms, 1h);
  auto task = test::make_task("default", "test:noop", 0);

  EXPECT_FALSE(policy.decide(task, TaskError::timeout("slow")).retry());
}

TEST(RetryPolicyTest, TimeoutAndStoreErrorsAreRetryable) {
  auto policy = no_jitter(100ms, 1h);
  auto task = test::make_task("default", "test:noop", 3);

  EXPECT_TRUE(policy.decide(task, TaskError::timeout("slow")).retry());
  EXPECT_TRUE(
      policy.decide(task, TaskError::store_unavailable("down")).retry());
  EXPECT_FALSE(
      policy.decide(task, TaskError::configuration("no handler")).retry());
  EXPECT_FALSE(policy.decide(task, TaskError::panic("x", true)).retry());
  EXPECT_TRUE(policy.decide(task, TaskError::panic("x", false)).retry());
}
