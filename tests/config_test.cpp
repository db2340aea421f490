#include "taskq/config/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "gtest/gtest.h"

using namespace taskq;
using namespace std::chrono_literals;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.storage.backend, StorageBackend::Sqlite);
  EXPECT_EQ(config.storage.db_file, "taskq.db");
  EXPECT_EQ(config.worker.concurrency, 10);
  EXPECT_EQ(config.worker.shutdown_timeout, 30s);
  EXPECT_EQ(config.worker.processing_timeout, 30min);
  ASSERT_EQ(config.queues.size(), 3u);
  EXPECT_EQ(config.queues[0].name, "critical");
  EXPECT_EQ(config.queues[0].weight, 6);
  EXPECT_EQ(config.queues[1].weight, 3);
  EXPECT_EQ(config.queues[2].weight, 1);
  EXPECT_EQ(config.retry.default_max_retry, 25);
  EXPECT_EQ(config.idempotency.ttl, 24h);
  EXPECT_EQ(config.idempotency.key_prefix, "idempotency:");
  EXPECT_EQ(config.idempotency.fail_mode, FailMode::Open);
  EXPECT_TRUE(validate(config).has_value());
}

TEST(ConfigTest, LoadFromString_FullDocument) {
  auto result = ConfigLoader::load_from_string(R"(
storage:
  backend: memory
  db_file: /tmp/ignored.db
worker:
  concurrency: 4
  shutdown_timeout_ms: 1500
  processing_timeout_ms: 2000
  poll_interval_ms: 50
  lease_ms: 3000
  janitor_interval_ms: 250
  completed_retention_ms: 10000
  panic_is_terminal: true
queues:
  - name: high
    weight: 5
  - name: bulk
retry:
  base_delay_ms: 10
  max_delay_ms: 100
  jitter: 0
  default_max_retry: 2
idempotency:
  ttl_ms: 60000
  key_prefix: "idem:"
  fail_mode: closed
log:
  level: debug
  file: /tmp/taskq.log
)");

  ASSERT_TRUE(result.has_value());
  const auto& c = *result;
  EXPECT_EQ(c.storage.backend, StorageBackend::Memory);
  EXPECT_EQ(c.worker.concurrency, 4);
  EXPECT_EQ(c.worker.shutdown_timeout, 1500ms);
  EXPECT_EQ(c.worker.processing_timeout, 2000ms);
  EXPECT_EQ(c.worker.poll_interval, 50ms);
  EXPECT_EQ(c.worker.lease, 3000ms);
  EXPECT_EQ(c.worker.janitor_interval, 250ms);
  EXPECT_EQ(c.worker.completed_retention, 10s);
  EXPECT_TRUE(c.worker.panic_is_terminal);
  ASSERT_EQ(c.queues.size(), 2u);
  EXPECT_EQ(c.queues[0].name, "high");
  EXPECT_EQ(c.queues[0].weight, 5);
  EXPECT_EQ(c.queues[1].name, "bulk");
  EXPECT_EQ(c.queues[1].weight, 1);
  EXPECT_EQ(c.retry.base_delay, 10ms);
  EXPECT_EQ(c.retry.max_delay, 100ms);
  EXPECT_DOUBLE_EQ(c.retry.jitter, 0.0);
  EXPECT_EQ(c.retry.default_max_retry, 2);
  EXPECT_EQ(c.idempotency.ttl, 60s);
  EXPECT_EQ(c.idempotency.key_prefix, "idem:");
  EXPECT_EQ(c.idempotency.fail_mode, FailMode::Closed);
  EXPECT_EQ(c.log.level, "debug");
  EXPECT_EQ(c.log.file, "/tmp/taskq.log");
}

TEST(ConfigTest, LoadFromString_PartialKeepsDefaults) {
  auto result = ConfigLoader::load_from_string("worker:\n  concurrency: 2\n");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->worker.concurrency, 2);
  EXPECT_EQ(result->worker.lease, 60s);
  EXPECT_EQ(result->queues.size(), 3u);
}

TEST(ConfigTest, LoadFromString_Empty_IsParseError) {
  auto result = ConfigLoader::load_from_string("");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_Malformed_IsParseError) {
  auto result = ConfigLoader::load_from_string("worker: [unclosed");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_UnknownFailMode_IsParseError) {
  for (const char* mode : {"close", "Closed", "fail"}) {
    auto result = ConfigLoader::load_from_string(
        std::string("idempotency:\n  fail_mode: ") + mode + "\n");

    ASSERT_FALSE(result.has_value()) << mode;
    EXPECT_EQ(result.error(), Error::ParseError) << mode;
  }
}

TEST(ConfigTest, LoadFromString_UnknownBackend_IsParseError) {
  auto result =
      ConfigLoader::load_from_string("storage:\n  backend: postgres\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_KnownEnumValues) {
  auto result = ConfigLoader::load_from_string(
      "storage:\n  backend: sqlite\nidempotency:\n  fail_mode: closed\n");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->storage.backend, StorageBackend::Sqlite);
  EXPECT_EQ(result->idempotency.fail_mode, FailMode::Closed);
}

TEST(ConfigTest, ParseEnumNames) {
  EXPECT_EQ(parse_fail_mode("open"), FailMode::Open);
  EXPECT_EQ(parse_fail_mode("closed"), FailMode::Closed);
  EXPECT_FALSE(parse_fail_mode("").has_value());
  EXPECT_EQ(parse_storage_backend("memory"), StorageBackend::Memory);
  EXPECT_FALSE(parse_storage_backend("redis").has_value());
}

TEST(ConfigTest, LoadFromFile_Missing_IsFileNotFound) {
  auto result = ConfigLoader::load_from_file("/nonexistent/taskq.yaml");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::FileNotFound);
}

TEST(ConfigTest, LoadFromFile_ReadsDocument) {
  auto path = std::filesystem::temp_directory_path() / "taskq_config_test.yaml";
  {
    std::ofstream out(path);
    out << "storage:\n  backend: memory\nworker:\n  concurrency: 3\n";
  }

  auto result = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->storage.backend, StorageBackend::Memory);
  EXPECT_EQ(result->worker.concurrency, 3);
}

TEST(ConfigTest, ToString_RoundTrips) {
  SystemConfig config;
  config.storage.backend = StorageBackend::Memory;
  config.worker.concurrency = 7;
  config.queues = {{"only", 2}};
  config.idempotency.fail_mode = FailMode::Closed;

  auto reparsed = ConfigLoader::load_from_string(ConfigLoader::to_string(config));

  ASSERT_TRUE(reparsed.has_value());
  EXPECT_EQ(reparsed->storage.backend, StorageBackend::Memory);
  EXPECT_EQ(reparsed->worker.concurrency, 7);
  ASSERT_EQ(reparsed->queues.size(), 1u);
  EXPECT_EQ(reparsed->queues[0].name, "only");
  EXPECT_EQ(reparsed->queues[0].weight, 2);
  EXPECT_EQ(reparsed->idempotency.fail_mode, FailMode::Closed);
}

TEST(ConfigValidateTest, RejectsNoQueues) {
  SystemConfig config;
  config.queues.clear();
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigValidateTest, RejectsDuplicateQueue) {
  SystemConfig config;
  config.queues = {{"a", 1}, {"a", 2}};
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigValidateTest, RejectsEmptyQueueName) {
  SystemConfig config;
  config.queues = {{"", 1}};
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigValidateTest, RejectsZeroWeight) {
  SystemConfig config;
  config.queues = {{"a", 0}};
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigValidateTest, RejectsZeroConcurrency) {
  SystemConfig config;
  config.worker.concurrency = 0;
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigValidateTest, RejectsNonPositiveTimeout) {
  SystemConfig config;
  config.worker.processing_timeout = 0ms;
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigValidateTest, RejectsMaxDelayBelowBase) {
  SystemConfig config;
  config.retry.base_delay = 10s;
  config.retry.max_delay = 1s;
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigValidateTest, RejectsNonPositiveTtl) {
  SystemConfig config;
  config.idempotency.ttl = 0ms;
  EXPECT_EQ(validate(config).error(), Error::InvalidArgument);
}

TEST(ConfigTest, LoadFromString_Schedules) {
  auto result = ConfigLoader::load_from_string(R"(
schedules:
  - cron: "0 0 * * *"
    type: cleanup:old_notes
    payload: '{"older_than_days": 30}'
    queue: low
    max_retry: 2
    description: purge archived notes
  - cron: "@hourly"
    type: health:check
)");

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->schedules.size(), 2u);
  const auto& first = result->schedules[0];
  EXPECT_EQ(first.cron, "0 0 * * *");
  EXPECT_EQ(first.type, "cleanup:old_notes");
  EXPECT_EQ(first.payload, R"({"older_than_days": 30})");
  EXPECT_EQ(first.queue, "low");
  EXPECT_EQ(first.max_retry, 2);
  const auto& second = result->schedules[1];
  EXPECT_EQ(second.payload, "{}");
  EXPECT_EQ(second.queue, "default");
  EXPECT_FALSE(second.max_retry.has_value());
  EXPECT_TRUE(validate(*result).has_value());
}

TEST(ConfigTest, ToString_KeepsSchedules) {
  SystemConfig config;
  config.schedules.push_back(
      {"*/5 * * * *", "cache:warm", R"({"key":"home"})", "low", 1, "warm"});

  auto reloaded = ConfigLoader::load_from_string(ConfigLoader::to_string(config));

  ASSERT_TRUE(reloaded.has_value());
  ASSERT_EQ(reloaded->schedules.size(), 1u);
  EXPECT_EQ(reloaded->schedules[0].cron, "*/5 * * * *");
  EXPECT_EQ(reloaded->schedules[0].payload, R"({"key":"home"})");
  EXPECT_EQ(reloaded->schedules[0].max_retry, 1);
}

TEST(ConfigValidateTest, RejectsBadSchedules) {
  auto with = [](ScheduleConfig sc) {
    SystemConfig config;
    config.schedules.push_back(std::move(sc));
    return validate(config);
  };

  EXPECT_EQ(with({"every day", "cleanup:old_notes"}).error(),
            Error::InvalidArgument);
  EXPECT_EQ(with({"@daily", ""}).error(), Error::InvalidArgument);
  EXPECT_EQ(with({"@daily", "cleanup:old_notes", "{}", "reports"}).error(),
            Error::InvalidArgument);
  EXPECT_EQ(with({"@daily", "cleanup:old_notes", "{not json"}).error(),
            Error::InvalidArgument);
  EXPECT_EQ(with({"@daily", "cleanup:old_notes", "{}", "low", -1}).error(),
            Error::InvalidArgument);
  EXPECT_TRUE(with({"@daily", "cleanup:old_notes"}).has_value());
}
