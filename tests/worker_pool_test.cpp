#include "taskq/worker/worker_pool.hpp"

#include "taskq/broker/memory_store.hpp"
#include "taskq/idempotency/guard.hpp"
#include "taskq/task/codec.hpp"

#include "faulty_store.hpp"
#include "test_utils.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

using namespace taskq;
using namespace taskq::test;
using namespace std::chrono_literals;

class WorkerPoolTest : public ::testing::Test {
protected:
  void TearDown() override {
    if (pool_) {
      pool_->stop();
    }
  }

  auto make_pool(WorkerOptions opts = fast_worker_options()) -> WorkerPool& {
    pool_ = std::make_unique<WorkerPool>(broker_, registry_, fast_retry(), opts,
                                         &metrics_, &store_);
    return *pool_;
  }

  static auto fast_worker_options() -> WorkerOptions {
    WorkerOptions opts;
    opts.concurrency = 2;
    opts.shutdown_timeout = 2s;
    opts.processing_timeout = 5s;
    opts.janitor_interval = 50ms;
    return opts;
  }

  static auto fast_retry() -> RetryPolicy {
    return RetryPolicy(RetryOptions{1ms, 10ms, 0.0});
  }

  auto enqueue(std::string_view type, EnqueueOptions opts = {},
               std::string_view queue = "default") -> TaskId {
    auto id = broker_.enqueue(queue, NewTask{std::string(type), to_bytes("{}")},
                              opts);
    EXPECT_TRUE(id.has_value());
    return id.value_or(TaskId{});
  }

  auto state_of(const TaskId& id, std::string_view queue = "default")
      -> std::optional<Task> {
    auto found = store_.find(queue, id.value());
    if (!found) {
      return std::nullopt;
    }
    return *found;
  }

  auto wait_for_state(const TaskId& id, TaskState state) -> bool {
    return wait_until([&] {
      auto t = state_of(id);
      return t && t->state == state;
    });
  }

  auto wait_until_gone(const TaskId& id) -> bool {
    return wait_until([&] { return !state_of(id).has_value(); });
  }

  MemoryStore store_;
  Broker broker_{store_, fast_broker_options()};
  HandlerRegistry registry_;
  Metrics metrics_;
  std::unique_ptr<WorkerPool> pool_;
};

TEST_F(WorkerPoolTest, SuccessfulTaskIsCompleted) {
  std::atomic<int> calls{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:ok", [&](TaskContext&, const Task&) -> HandlerResult {
        ++calls;
        return {};
      }));
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:ok");

  ASSERT_TRUE(wait_until_gone(id));
  EXPECT_EQ(calls.load(), 1);
  EXPECT_TRUE(wait_until([&] {
    return metrics_.processed("test:ok", "default", "success") == 1;
  }));
}

TEST_F(WorkerPoolTest, SkipRetryFailsAfterOneAttempt) {
  std::atomic<int> calls{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:invalid", [&](TaskContext&, const Task&) -> HandlerResult {
        ++calls;
        return skip_retry("invalid payload");
      }));
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:invalid", EnqueueOptions{.max_retry = 5});

  ASSERT_TRUE(wait_for_state(id, TaskState::Failed));
  auto t = state_of(id);
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(t->retry_count, 0);
  EXPECT_EQ(t->last_error, "invalid payload");
}

TEST_F(WorkerPoolTest, RetriesUntilBudgetIsSpent) {
  std::atomic<int> calls{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:flaky", [&](TaskContext&, const Task&) -> HandlerResult {
        ++calls;
        return retryable("upstream unavailable");
      }));
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:flaky", EnqueueOptions{.max_retry = 2});

  ASSERT_TRUE(wait_for_state(id, TaskState::Failed));
  auto t = state_of(id);
  EXPECT_EQ(calls.load(), 3);
  EXPECT_EQ(t->retry_count, 2);
  EXPECT_EQ(t->last_error, "upstream unavailable");
}

TEST_F(WorkerPoolTest, RetryEventuallySucceeds) {
  std::mutex mu;
  std::vector<int> seen_counts;
  ASSERT_TRUE(registry_.register_handler(
      "test:second-time", [&](TaskContext&, const Task& t) -> HandlerResult {
        std::lock_guard lock(mu);
        seen_counts.push_back(t.retry_count);
        if (t.retry_count == 0) {
          return retryable("first attempt fails");
        }
        return {};
      }));
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:second-time");

  ASSERT_TRUE(wait_until_gone(id));
  std::lock_guard lock(mu);
  EXPECT_EQ(seen_counts, (std::vector<int>{0, 1}));
}

TEST_F(WorkerPoolTest, DeadlineExceededIsRetriedAsTimeout) {
  std::mutex mu;
  std::vector<int> seen_counts;
  ASSERT_TRUE(registry_.register_handler(
      "test:slow", [&](TaskContext& ctx, const Task& t) -> HandlerResult {
        {
          std::lock_guard lock(mu);
          seen_counts.push_back(t.retry_count);
        }
        if (t.retry_count == 0) {
          ctx.token().wait_for(5s);
          return retryable("interrupted");
        }
        return {};
      }));
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:slow", EnqueueOptions{.timeout = 100ms});

  ASSERT_TRUE(wait_until_gone(id));
  std::lock_guard lock(mu);
  EXPECT_EQ(seen_counts, (std::vector<int>{0, 1}));
}

TEST_F(WorkerPoolTest, UnknownTypeFailsWithoutRetry) {
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:unregistered", EnqueueOptions{.max_retry = 5});

  ASSERT_TRUE(wait_for_state(id, TaskState::Failed));
  auto t = state_of(id);
  EXPECT_EQ(t->retry_count, 0);
  EXPECT_NE(t->last_error.find("test:unregistered"), std::string::npos);
}

TEST_F(WorkerPoolTest, PanicIsRecoveredAndRetried) {
  std::atomic<int> calls{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:panic", [&](TaskContext&, const Task&) -> HandlerResult {
        ++calls;
        throw std::runtime_error("boom");
      }));
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:panic", EnqueueOptions{.max_retry = 1});

  ASSERT_TRUE(wait_for_state(id, TaskState::Failed));
  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(state_of(id)->last_error, "panic recovered: boom");
  EXPECT_TRUE(pool_->running());
}

TEST_F(WorkerPoolTest, TerminalPanicFailsImmediately) {
  std::atomic<int> calls{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:panic", [&](TaskContext&, const Task&) -> HandlerResult {
        ++calls;
        throw std::runtime_error("boom");
      }));
  auto opts = fast_worker_options();
  opts.panic_is_terminal = true;
  ASSERT_TRUE(make_pool(opts).start());

  auto id = enqueue("test:panic", EnqueueOptions{.max_retry = 5});

  ASSERT_TRUE(wait_for_state(id, TaskState::Failed));
  EXPECT_EQ(calls.load(), 1);
}

TEST_F(WorkerPoolTest, ConcurrencyIsBounded) {
  std::atomic<int> current{0};
  std::atomic<int> peak{0};
  std::atomic<int> done{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:busy", [&](TaskContext&, const Task&) -> HandlerResult {
        int now = ++current;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        sleep_ms(20ms);
        --current;
        ++done;
        return {};
      }));
  ASSERT_TRUE(make_pool().start());

  for (int i = 0; i < 10; ++i) {
    enqueue("test:busy");
  }

  ASSERT_TRUE(wait_until([&] { return done.load() == 10; }));
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

TEST_F(WorkerPoolTest, StopWaitsForInFlightTask) {
  std::atomic<bool> started{false};
  ASSERT_TRUE(registry_.register_handler(
      "test:slow", [&](TaskContext&, const Task&) -> HandlerResult {
        started = true;
        sleep_ms(150ms);
        return {};
      }));
  auto& pool = make_pool();
  ASSERT_TRUE(pool.start());

  auto id = enqueue("test:slow");
  ASSERT_TRUE(wait_until([&] { return started.load(); }));
  pool.stop();

  EXPECT_FALSE(pool.running());
  EXPECT_EQ(pool.in_flight(), 0u);
  EXPECT_FALSE(state_of(id).has_value());
}

TEST_F(WorkerPoolTest, ShutdownTimeoutReturnsTaskForRetry) {
  std::atomic<bool> started{false};
  ASSERT_TRUE(registry_.register_handler(
      "test:stuck", [&](TaskContext& ctx, const Task&) -> HandlerResult {
        started = true;
        ctx.token().wait_for(10s);
        return skip_retry("stopped early");
      }));
  auto opts = fast_worker_options();
  opts.shutdown_timeout = 50ms;
  auto& pool = make_pool(opts);
  ASSERT_TRUE(pool.start());

  auto id = enqueue("test:stuck");
  ASSERT_TRUE(wait_until([&] { return started.load(); }));
  pool.stop();

  auto t = state_of(id);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->state, TaskState::Retry);
  EXPECT_EQ(t->retry_count, 1);
}

TEST_F(WorkerPoolTest, TasksLeftPendingSurviveStop) {
  auto& pool = make_pool();
  ASSERT_TRUE(pool.start());
  pool.stop();

  auto id = enqueue("test:never-run");

  auto t = state_of(id);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->state, TaskState::Pending);
}

TEST_F(WorkerPoolTest, StartTwiceIsRejected) {
  auto& pool = make_pool();
  ASSERT_TRUE(pool.start());

  auto again = pool.start();

  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), Error::AlreadyExists);
}

TEST_F(WorkerPoolTest, ZeroConcurrencyIsRejected) {
  auto opts = fast_worker_options();
  opts.concurrency = 0;

  auto r = make_pool(opts).start();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
}

TEST_F(WorkerPoolTest, StartFreezesRegistry) {
  ASSERT_TRUE(make_pool().start());

  auto r = registry_.register_handler(
      "test:late", [](TaskContext&, const Task&) -> HandlerResult { return {}; });

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::AlreadyFrozen);
}

TEST_F(WorkerPoolTest, RunReturnsWhenTokenIsCancelled) {
  auto& pool = make_pool();
  CancellationSource source;
  auto runner = std::async(std::launch::async,
                           [&] { return pool.run(source.token()); });

  ASSERT_TRUE(wait_until([&] { return pool.running(); }));
  source.cancel(CancelReason::Shutdown);

  ASSERT_EQ(runner.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(runner.get().has_value());
  EXPECT_FALSE(pool.running());
}

TEST_F(WorkerPoolTest, ExtraMiddlewareRunsInsideChain) {
  std::atomic<int> wrapped{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:ok", [](TaskContext&, const Task&) -> HandlerResult { return {}; }));
  auto& pool = make_pool();
  pool.use([&](Handler next) -> Handler {
    return [&, next](TaskContext& ctx, const Task& t) -> HandlerResult {
      ++wrapped;
      return next(ctx, t);
    };
  });
  ASSERT_TRUE(pool.start());

  auto id = enqueue("test:ok");

  ASSERT_TRUE(wait_until_gone(id));
  EXPECT_EQ(wrapped.load(), 1);
}

TEST_F(WorkerPoolTest, IdempotentHandlerRunsOncePerKey) {
  IdempotencyGuard guard(store_, "idem:");
  std::atomic<int> calls{0};
  IdempotentOptions idem;
  idem.key_extractor = [](const Task& t) {
    auto j = decode_json(t.payload);
    return j ? j->value("order_id", "") : std::string{};
  };
  ASSERT_TRUE(registry_.register_handler(
      "order:archive",
      make_idempotent(
          [&](TaskContext&, const Task&) -> HandlerResult {
            ++calls;
            return {};
          },
          guard, idem)));
  ASSERT_TRUE(make_pool().start());

  auto payload = to_bytes(R"({"order_id":"o-1"})");
  auto a = broker_.enqueue("default", NewTask{"order:archive", payload});
  auto b = broker_.enqueue("default", NewTask{"order:archive", payload});
  ASSERT_TRUE(a && b);

  ASSERT_TRUE(wait_until_gone(*a));
  ASSERT_TRUE(wait_until_gone(*b));
  EXPECT_EQ(calls.load(), 1);
}

TEST_F(WorkerPoolTest, IdempotentHandlerThatThrowsIsRetried) {
  IdempotencyGuard guard(store_, "idem:");
  std::atomic<int> calls{0};
  IdempotentOptions idem;
  idem.key_extractor = [](const Task& t) {
    auto j = decode_json(t.payload);
    return j ? j->value("order_id", "") : std::string{};
  };
  ASSERT_TRUE(registry_.register_handler(
      "order:archive",
      make_idempotent(
          [&](TaskContext&, const Task& t) -> HandlerResult {
            ++calls;
            if (t.retry_count == 0) {
              throw std::runtime_error("archive bucket unreachable");
            }
            return {};
          },
          guard, idem)));
  ASSERT_TRUE(make_pool().start());

  auto id = broker_.enqueue("default",
                            NewTask{"order:archive",
                                    to_bytes(R"({"order_id":"o-7"})")},
                            EnqueueOptions{.max_retry = 2});
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(wait_until_gone(*id));
  EXPECT_EQ(calls.load(), 2);
}

TEST_F(WorkerPoolTest, LateSuccessIsCountedAsFailure) {
  std::atomic<int> calls{0};
  ASSERT_TRUE(registry_.register_handler(
      "test:late", [&](TaskContext&, const Task& t) -> HandlerResult {
        ++calls;
        if (t.retry_count == 0) {
          sleep_ms(200ms);
        }
        return {};
      }));
  ASSERT_TRUE(make_pool().start());

  auto id = enqueue("test:late", EnqueueOptions{.max_retry = 1,
                                                .timeout = 100ms});

  ASSERT_TRUE(wait_until_gone(id));
  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(metrics_.processed("test:late", "default", "failed"), 1u);
  EXPECT_EQ(metrics_.processed("test:late", "default", "success"), 1u);
}

class WorkerPoolShutdownTest : public ::testing::Test {
protected:
  static auto options() -> WorkerOptions {
    WorkerOptions opts;
    opts.concurrency = 1;
    opts.shutdown_timeout = 50ms;
    opts.processing_timeout = 5s;
    return opts;
  }

  FaultyStore store_;
  Broker broker_{store_, fast_broker_options()};
  HandlerRegistry registry_;
  WorkerPool pool_{broker_, registry_, RetryPolicy(RetryOptions{1ms, 10ms, 0.0}),
                   options(), nullptr, &store_};
};

TEST_F(WorkerPoolShutdownTest, TaskClaimedDuringShutdownStartsCancelled) {
  std::atomic<CancelReason> seen{CancelReason::None};
  ASSERT_TRUE(registry_.register_handler(
      "test:claimed", [&](TaskContext& ctx, const Task&) -> HandlerResult {
        ctx.token().wait_for(2s);
        seen = ctx.token().reason();
        return retryable("stopped");
      }));
  store_.stall_after_take_ms = 300;
  auto id = broker_.enqueue("critical", NewTask{"test:claimed", {}},
                            EnqueueOptions{.max_retry = 3});
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(pool_.start());
  ASSERT_TRUE(wait_until([&] { return store_.stalled.load(); }));

  auto began = std::chrono::steady_clock::now();
  pool_.stop();
  auto took = std::chrono::steady_clock::now() - began;

  EXPECT_EQ(seen.load(), CancelReason::Shutdown);
  EXPECT_LT(took, 1500ms);
  auto found = store_.inner.find("critical", id->value());
  ASSERT_TRUE(found && *found);
  EXPECT_EQ((*found)->state, TaskState::Retry);
  EXPECT_EQ((*found)->retry_count, 1);
}

class WorkerPoolJanitorTest : public ::testing::Test {
protected:
  static auto short_lease() -> BrokerOptions {
    auto opts = fast_broker_options();
    opts.lease = 10ms;
    return opts;
  }

  MemoryStore store_;
  Broker broker_{store_, short_lease()};
  HandlerRegistry registry_;
  Metrics metrics_;
  WorkerPool pool_{broker_, registry_, RetryPolicy{}, WorkerOptions{},
                   &metrics_, &store_};
};

TEST_F(WorkerPoolJanitorTest, RecoversTaskWithExpiredLease) {
  auto id = broker_.enqueue("default", NewTask{"test:noop", {}},
                            EnqueueOptions{.max_retry = 3});
  ASSERT_TRUE(id.has_value());
  auto taken = broker_.try_dequeue();
  ASSERT_TRUE(taken && *taken);
  sleep_ms(30ms);

  pool_.run_janitor();

  auto found = store_.find("default", id->value());
  ASSERT_TRUE(found && *found);
  EXPECT_EQ((*found)->state, TaskState::Retry);
  EXPECT_EQ((*found)->retry_count, 1);
}

TEST_F(WorkerPoolJanitorTest, ExpiredLeaseWithNoBudgetFails) {
  auto id = broker_.enqueue("default", NewTask{"test:noop", {}},
                            EnqueueOptions{.max_retry = 0});
  ASSERT_TRUE(id.has_value());
  auto taken = broker_.try_dequeue();
  ASSERT_TRUE(taken && *taken);
  sleep_ms(30ms);

  pool_.run_janitor();

  auto found = store_.find("default", id->value());
  ASSERT_TRUE(found && *found);
  EXPECT_EQ((*found)->state, TaskState::Failed);
}

TEST_F(WorkerPoolJanitorTest, RefreshesQueueDepth) {
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(broker_.enqueue("low", NewTask{"test:noop", {}}));
  }

  pool_.run_janitor();

  EXPECT_EQ(metrics_.queue_depth("low"), 3);
  EXPECT_EQ(metrics_.queue_depth("critical"), 0);
}

TEST_F(WorkerPoolJanitorTest, PurgesExpiredIdempotencyRecords) {
  ASSERT_TRUE(store_.set("idem:old", to_bytes("x"), 1ms));
  sleep_ms(10ms);

  pool_.run_janitor();

  auto purged = store_.purge_expired();
  ASSERT_TRUE(purged.has_value());
  EXPECT_EQ(*purged, 0u);
}
