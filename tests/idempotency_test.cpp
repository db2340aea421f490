#include "taskq/idempotency/guard.hpp"
#include "taskq/task/codec.hpp"

#include "faulty_store.hpp"
#include "test_utils.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskq;
using namespace taskq::test;
using namespace std::chrono_literals;

namespace {

auto context_for(const Task& task) -> TaskContext {
  return TaskContext(task, std::chrono::steady_clock::now() + 10s,
                     CancellationToken::none());
}

}  // namespace

class IdempotencyGuardTest : public ::testing::Test {
protected:
  FaultyStore store_;
  IdempotencyGuard guard_{store_, "idem:"};
};

TEST_F(IdempotencyGuardTest, FirstReserveOwnsKey) {
  auto res = guard_.reserve("k1", 1h);

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->reserved);
  EXPECT_FALSE(res->already_handled);
}

TEST_F(IdempotencyGuardTest, SecondReserveIsDuplicate) {
  ASSERT_TRUE(guard_.reserve("k1", 1h));

  auto res = guard_.reserve("k1", 1h);

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->already_handled);
  EXPECT_FALSE(res->reserved);
  EXPECT_FALSE(res->cached_result.has_value());
}

TEST_F(IdempotencyGuardTest, ReleaseCachesResult) {
  ASSERT_TRUE(guard_.reserve("k1", 1h));
  ASSERT_TRUE(guard_.release("k1", to_bytes("archived"), 1h));

  auto res = guard_.reserve("k1", 1h);

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->already_handled);
  ASSERT_TRUE(res->cached_result.has_value());
  EXPECT_EQ(to_string(*res->cached_result), "archived");
}

TEST_F(IdempotencyGuardTest, AbandonFreesInProgressKey) {
  ASSERT_TRUE(guard_.reserve("k1", 1h));
  ASSERT_TRUE(guard_.abandon("k1"));

  auto res = guard_.reserve("k1", 1h);

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->reserved);
}

TEST_F(IdempotencyGuardTest, AbandonKeepsCompletedRecord) {
  ASSERT_TRUE(guard_.reserve("k1", 1h));
  ASSERT_TRUE(guard_.release("k1", std::nullopt, 1h));
  ASSERT_TRUE(guard_.abandon("k1"));

  auto res = guard_.reserve("k1", 1h);

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->already_handled);
}

TEST_F(IdempotencyGuardTest, ExpiredKeyCanBeReservedAgain) {
  ASSERT_TRUE(guard_.reserve("k1", 20ms));
  sleep_ms(50ms);

  auto res = guard_.reserve("k1", 1h);

  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->reserved);
}

TEST_F(IdempotencyGuardTest, EmptyKeyAlwaysProceeds) {
  auto first = guard_.reserve("", 1h);
  auto second = guard_.reserve("", 1h);

  ASSERT_TRUE(first && second);
  EXPECT_FALSE(first->already_handled);
  EXPECT_FALSE(second->already_handled);
}

TEST_F(IdempotencyGuardTest, KeysArePrefixed) {
  ASSERT_TRUE(guard_.reserve("k1", 1h));

  auto raw = store_.inner.get("idem:k1");

  ASSERT_TRUE(raw.has_value());
  EXPECT_TRUE(raw->has_value());
  EXPECT_EQ(guard_.full_key("abc"), "idem:abc");
}

TEST_F(IdempotencyGuardTest, ConcurrentReserveHasOneWinner) {
  constexpr int kThreads = 16;
  std::atomic<int> winners{0};
  std::atomic<int> duplicates{0};
  std::vector<std::jthread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      auto res = guard_.reserve("shared", 1h);
      if (res && res->reserved) {
        ++winners;
      } else if (res && res->already_handled) {
        ++duplicates;
      }
    });
  }
  threads.clear();

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(duplicates.load(), kThreads - 1);
}

TEST_F(IdempotencyGuardTest, FailOpenProceedsWhenStoreIsDown) {
  store_.down = true;

  auto res = guard_.reserve("k1", 1h, FailMode::Open);

  ASSERT_TRUE(res.has_value());
  EXPECT_FALSE(res->already_handled);
  EXPECT_FALSE(res->reserved);
}

TEST_F(IdempotencyGuardTest, FailClosedReportsStoreUnavailable) {
  store_.down = true;

  auto res = guard_.reserve("k1", 1h, FailMode::Closed);

  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), Error::StoreUnavailable);
}

TEST_F(IdempotencyGuardTest, ReleaseWhileDownIsStoreUnavailable) {
  ASSERT_TRUE(guard_.reserve("k1", 1h));
  store_.down = true;

  auto r = guard_.release("k1", std::nullopt, 1h);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::StoreUnavailable);
}

class MakeIdempotentTest : public ::testing::Test {
protected:
  auto counting_handler() -> Handler {
    return [this](TaskContext& ctx, const Task&) -> HandlerResult {
      ++calls_;
      ctx.set_result(to_bytes("done"));
      return {};
    };
  }

  FaultyStore store_;
  IdempotencyGuard guard_{store_, "idem:"};
  int calls_{0};
};

TEST_F(MakeIdempotentTest, DuplicateSkipsHandlerAndReturnsCachedResult) {
  auto handler = make_idempotent(counting_handler(), guard_);
  auto task = make_task("default");

  auto ctx1 = context_for(task);
  auto ctx2 = context_for(task);
  auto first = handler(ctx1, task);
  auto second = handler(ctx2, task);

  EXPECT_TRUE(first.has_value());
  EXPECT_TRUE(second.has_value());
  EXPECT_EQ(calls_, 1);
  ASSERT_TRUE(ctx2.result().has_value());
  EXPECT_EQ(to_string(*ctx2.result()), "done");
}

TEST_F(MakeIdempotentTest, FailedAttemptCanBeRetried) {
  int attempts = 0;
  auto handler = make_idempotent(
      [&](TaskContext&, const Task&) -> HandlerResult {
        if (++attempts == 1) {
          return retryable("flaky");
        }
        return {};
      },
      guard_);
  auto task = make_task("default");

  auto ctx1 = context_for(task);
  auto ctx2 = context_for(task);
  auto first = handler(ctx1, task);
  auto second = handler(ctx2, task);

  EXPECT_FALSE(first.has_value());
  EXPECT_TRUE(second.has_value());
  EXPECT_EQ(attempts, 2);
}

TEST_F(MakeIdempotentTest, ThrowingHandlerReleasesKeyAndRethrows) {
  int attempts = 0;
  auto handler = make_idempotent(
      [&](TaskContext&, const Task&) -> HandlerResult {
        if (++attempts == 1) {
          throw std::runtime_error("connection reset");
        }
        return {};
      },
      guard_);
  auto task = make_task("default");

  auto ctx1 = context_for(task);
  EXPECT_THROW((void)handler(ctx1, task), std::runtime_error);
  auto ctx2 = context_for(task);
  auto second = handler(ctx2, task);

  EXPECT_TRUE(second.has_value());
  EXPECT_EQ(attempts, 2);
}

TEST_F(MakeIdempotentTest, CustomKeyExtractorDeduplicatesAcrossTasks) {
  IdempotentOptions opts;
  opts.key_extractor = [](const Task& t) { return t.type + ":same-order"; };
  auto handler = make_idempotent(counting_handler(), guard_, opts);
  auto a = make_task("default");
  auto b = make_task("default");

  auto ctx_a = context_for(a);
  auto ctx_b = context_for(b);
  ASSERT_TRUE(handler(ctx_a, a));
  ASSERT_TRUE(handler(ctx_b, b));

  EXPECT_EQ(calls_, 1);
}

TEST_F(MakeIdempotentTest, EmptyExtractedKeyRunsEveryTime) {
  IdempotentOptions opts;
  opts.key_extractor = [](const Task&) { return std::string{}; };
  auto handler = make_idempotent(counting_handler(), guard_, opts);
  auto task = make_task("default");

  auto ctx1 = context_for(task);
  auto ctx2 = context_for(task);
  ASSERT_TRUE(handler(ctx1, task));
  ASSERT_TRUE(handler(ctx2, task));

  EXPECT_EQ(calls_, 2);
}

TEST_F(MakeIdempotentTest, FailClosedOutageIsRetryableStoreError) {
  IdempotentOptions opts;
  opts.fail_mode = FailMode::Closed;
  auto handler = make_idempotent(counting_handler(), guard_, opts);
  auto task = make_task("default");
  store_.down = true;

  auto ctx = context_for(task);
  auto result = handler(ctx, task);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, FailureKind::StoreUnavailable);
  EXPECT_FALSE(result.error().skip_retry);
  EXPECT_EQ(calls_, 0);
}

TEST_F(MakeIdempotentTest, FailOpenOutageRunsHandler) {
  auto handler = make_idempotent(counting_handler(), guard_);
  auto task = make_task("default");
  store_.down = true;

  auto ctx = context_for(task);
  auto result = handler(ctx, task);

  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(calls_, 1);
}
