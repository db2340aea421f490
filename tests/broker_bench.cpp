#include <benchmark/benchmark.h>

#include <filesystem>
#include <string>

#include "taskq/broker/broker.hpp"
#include "taskq/broker/memory_store.hpp"
#include "taskq/broker/sqlite_store.hpp"
#include "taskq/idempotency/guard.hpp"
#include "taskq/task/codec.hpp"
#include "taskq/util/log.hpp"

namespace {

using namespace taskq;

auto bench_options() -> BrokerOptions {
  BrokerOptions opts;
  opts.queues = {{"critical", 6}, {"default", 3}, {"low", 1}};
  return opts;
}

const char* const kQueues[] = {"critical", "default", "low"};

}  // namespace

static void BM_MemoryEnqueueDequeue(benchmark::State& state) {
  log::set_level("error");
  MemoryStore store;
  Broker broker(store, bench_options());
  auto payload = to_bytes(R"({"order_id":"3f2b8c1e-9a4d-4e6f-8b21-0c7d5e9a1b34"})");

  for (auto _ : state) {
    auto id = broker.enqueue("default", NewTask{"order:archive", payload});
    auto task = broker.try_dequeue();
    if (task && *task) {
      (void)broker.complete(**task);
    }
    benchmark::DoNotOptimize(id);
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_WeightedDequeue(benchmark::State& state) {
  log::set_level("error");
  MemoryStore store;
  Broker broker(store, bench_options());
  const auto backlog = state.range(0);
  for (std::int64_t i = 0; i < backlog; ++i) {
    (void)broker.enqueue(kQueues[i % 3], NewTask{"bench:noop", {}});
  }

  for (auto _ : state) {
    auto task = broker.try_dequeue();
    if (task && *task) {
      (void)broker.complete(**task);
      (void)broker.enqueue((*task)->queue, NewTask{"bench:noop", {}});
    }
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_SqliteEnqueueDequeue(benchmark::State& state) {
  log::set_level("error");
  auto path = (std::filesystem::temp_directory_path() / "taskq_bench.db").string();
  std::filesystem::remove(path);
  SqliteStore store(path);
  if (!store.open()) {
    state.SkipWithError("cannot open sqlite store");
    return;
  }
  Broker broker(store, bench_options());

  for (auto _ : state) {
    auto id = broker.enqueue("default", NewTask{"bench:noop", {}});
    auto task = broker.try_dequeue();
    if (task && *task) {
      (void)broker.complete(**task);
    }
    benchmark::DoNotOptimize(id);
  }
  state.SetItemsProcessed(state.iterations());

  store.close();
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path + suffix);
  }
}

static void BM_IdempotencyReserveRelease(benchmark::State& state) {
  log::set_level("error");
  MemoryStore store;
  IdempotencyGuard guard(store, "idem:");
  std::int64_t n = 0;

  for (auto _ : state) {
    auto key = std::to_string(n++);
    auto res = guard.reserve(key, std::chrono::hours(1));
    (void)guard.release(key, std::nullopt, std::chrono::hours(1));
    benchmark::DoNotOptimize(res);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_MemoryEnqueueDequeue);
BENCHMARK(BM_WeightedDequeue)->Arg(100)->Arg(10000);
BENCHMARK(BM_SqliteEnqueueDequeue);
BENCHMARK(BM_IdempotencyReserveRelease);
