#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskq {

enum class StorageBackend { Sqlite, Memory };

[[nodiscard]] constexpr auto storage_backend_name(StorageBackend b) noexcept
    -> std::string_view {
  switch (b) {
    case StorageBackend::Sqlite: return "sqlite";
    case StorageBackend::Memory: return "memory";
  }
  return "sqlite";
}

[[nodiscard]] inline auto parse_storage_backend(std::string_view str) noexcept
    -> std::optional<StorageBackend> {
  if (str == "sqlite") return StorageBackend::Sqlite;
  if (str == "memory") return StorageBackend::Memory;
  return std::nullopt;
}

enum class FailMode { Open, Closed };

[[nodiscard]] constexpr auto fail_mode_name(FailMode m) noexcept
    -> std::string_view {
  switch (m) {
    case FailMode::Open: return "open";
    case FailMode::Closed: return "closed";
  }
  return "open";
}

[[nodiscard]] inline auto parse_fail_mode(std::string_view str) noexcept
    -> std::optional<FailMode> {
  if (str == "open") return FailMode::Open;
  if (str == "closed") return FailMode::Closed;
  return std::nullopt;
}

struct StorageConfig {
  StorageBackend backend{StorageBackend::Sqlite};
  std::string db_file{"taskq.db"};
};

struct WorkerConfig {
  int concurrency{10};
  std::chrono::milliseconds shutdown_timeout{30'000};
  std::chrono::milliseconds processing_timeout{1'800'000};
  std::chrono::milliseconds poll_interval{1'000};
  std::chrono::milliseconds lease{60'000};
  std::chrono::milliseconds janitor_interval{5'000};
  std::chrono::milliseconds completed_retention{0};
  bool panic_is_terminal{false};
};

struct QueueConfig {
  std::string name;
  int weight{1};
};

struct RetryConfig {
  std::chrono::milliseconds base_delay{1'000};
  std::chrono::milliseconds max_delay{600'000};
  double jitter{0.2};
  int default_max_retry{25};
};

struct IdempotencyConfig {
  std::chrono::milliseconds ttl{86'400'000};
  std::string key_prefix{"idempotency:"};
  FailMode fail_mode{FailMode::Open};
};

// A task enqueued on a cron schedule by the `schedule` command. The payload
// is JSON text.
struct ScheduleConfig {
  std::string cron;
  std::string type;
  std::string payload{"{}"};
  std::string queue{"default"};
  std::optional<int> max_retry;
  std::string description;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

[[nodiscard]] inline auto default_queues() -> std::vector<QueueConfig> {
  return {{"critical", 6}, {"default", 3}, {"low", 1}};
}

struct SystemConfig {
  StorageConfig storage;
  WorkerConfig worker;
  std::vector<QueueConfig> queues{default_queues()};
  RetryConfig retry;
  IdempotencyConfig idempotency;
  std::vector<ScheduleConfig> schedules;
  LogConfig log;
};

}  // namespace taskq
