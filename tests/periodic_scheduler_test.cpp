#include "taskq/schedule/periodic.hpp"

#include "taskq/app/application.hpp"
#include "taskq/broker/memory_store.hpp"
#include "taskq/task/codec.hpp"

#include "faulty_store.hpp"
#include "test_utils.hpp"

#include <chrono>

#include "gtest/gtest.h"

using namespace taskq;
using namespace taskq::test;
using namespace std::chrono;
using namespace std::chrono_literals;

namespace {

auto at(int h, int min) -> TimePoint {
  return TimePoint{sys_days{year{2024} / January / day{15}}} + hours{h} +
         minutes{min};
}

auto cleanup_job(std::string cron = "*/5 * * * *") -> ScheduledJob {
  ScheduledJob job;
  job.cronspec = std::move(cron);
  job.type = "cleanup:old_notes";
  job.payload = {{"older_than_days", 30}};
  job.options.queue = "low";
  job.description = "purge archived notes";
  return job;
}

}  // namespace

class PeriodicSchedulerTest : public ::testing::Test {
protected:
  auto pending(std::string_view queue) -> std::int64_t {
    auto c = store_.counts(queue, Clock::now());
    EXPECT_TRUE(c.has_value());
    return c ? c->pending : -1;
  }

  MemoryStore store_;
  Broker broker_{store_, fast_broker_options()};
  Client client_{broker_};
  PeriodicScheduler scheduler_{client_};
};

TEST_F(PeriodicSchedulerTest, RegisterComputesFirstRun) {
  auto id = scheduler_.register_job(cleanup_job(), at(10, 31));

  ASSERT_TRUE(id.has_value());
  EXPECT_FALSE(id->empty());
  auto entries = scheduler_.entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].id, *id);
  EXPECT_EQ(entries[0].next_run, at(10, 35));
  EXPECT_EQ(scheduler_.next_run(), at(10, 35));
}

TEST_F(PeriodicSchedulerTest, InvalidCronIsRejected) {
  auto id = scheduler_.register_job(cleanup_job("every five minutes"));

  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error(), Error::ParseError);
  EXPECT_TRUE(scheduler_.entries().empty());
}

TEST_F(PeriodicSchedulerTest, EmptyTypeIsRejected) {
  auto job = cleanup_job();
  job.type.clear();

  auto id = scheduler_.register_job(job);

  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error(), Error::InvalidArgument);
}

TEST_F(PeriodicSchedulerTest, TickEnqueuesOnlyDueJobs) {
  ASSERT_TRUE(scheduler_.register_job(cleanup_job(), at(10, 31)));

  EXPECT_EQ(scheduler_.tick(at(10, 34)), 0u);
  EXPECT_EQ(pending("low"), 0);

  EXPECT_EQ(scheduler_.tick(at(10, 35)), 1u);
  EXPECT_EQ(pending("low"), 1);
  EXPECT_EQ(scheduler_.next_run(), at(10, 40));
  EXPECT_EQ(scheduler_.entries()[0].last_run, at(10, 35));

  auto tasks = store_.list("low", TaskFilter::Queued, 0, 10);
  ASSERT_TRUE(tasks.has_value());
  ASSERT_EQ(tasks->size(), 1u);
  EXPECT_EQ((*tasks)[0].type, "cleanup:old_notes");
  auto payload = decode_json((*tasks)[0].payload);
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ((*payload)["older_than_days"], 30);
}

TEST_F(PeriodicSchedulerTest, MissedRunsFireOnce) {
  ASSERT_TRUE(scheduler_.register_job(cleanup_job(), at(10, 31)));

  EXPECT_EQ(scheduler_.tick(at(12, 2)), 1u);

  EXPECT_EQ(pending("low"), 1);
  EXPECT_EQ(scheduler_.next_run(), at(12, 5));
}

TEST_F(PeriodicSchedulerTest, RegisterJobsStopsAtFirstInvalid) {
  std::vector<ScheduledJob> jobs{cleanup_job("0 * * * *"),
                                 cleanup_job("61 * * * *"),
                                 cleanup_job("0 0 * * *")};

  auto ids = scheduler_.register_jobs(std::move(jobs));

  ASSERT_FALSE(ids.has_value());
  EXPECT_EQ(ids.error(), Error::ParseError);
  EXPECT_EQ(scheduler_.entries().size(), 1u);
}

TEST_F(PeriodicSchedulerTest, RegisterJobsReturnsIdsInOrder) {
  auto ids = scheduler_.register_jobs(
      {cleanup_job("0 * * * *"), cleanup_job("@daily")});

  ASSERT_TRUE(ids.has_value());
  ASSERT_EQ(ids->size(), 2u);
  auto entries = scheduler_.entries();
  EXPECT_EQ(entries[0].id, (*ids)[0]);
  EXPECT_EQ(entries[1].id, (*ids)[1]);
}

TEST_F(PeriodicSchedulerTest, UnregisteredJobNoLongerFires) {
  auto id = scheduler_.register_job(cleanup_job(), at(10, 31));
  ASSERT_TRUE(id.has_value());

  EXPECT_TRUE(scheduler_.unregister(*id));
  EXPECT_FALSE(scheduler_.unregister(*id));

  EXPECT_EQ(scheduler_.tick(at(11, 0)), 0u);
  EXPECT_EQ(scheduler_.next_run(), TimePoint::max());
}

TEST_F(PeriodicSchedulerTest, UnknownQueueIsLoggedNotFatal) {
  auto job = cleanup_job();
  job.options.queue = "reports";
  ASSERT_TRUE(scheduler_.register_job(job, at(10, 31)));

  EXPECT_EQ(scheduler_.tick(at(10, 35)), 1u);

  EXPECT_EQ(scheduler_.next_run(), at(10, 40));
}

TEST_F(PeriodicSchedulerTest, BackgroundThreadFiresDueJob) {
  ASSERT_TRUE(
      scheduler_.register_job(cleanup_job("* * * * *"), Clock::now() - 5min));
  ASSERT_TRUE(scheduler_.start());

  EXPECT_TRUE(wait_until([&] { return pending("low") >= 1; }));
  scheduler_.stop();

  EXPECT_FALSE(scheduler_.running());
  EXPECT_FALSE(scheduler_.entries()[0].last_run == TimePoint{});
}

TEST_F(PeriodicSchedulerTest, StartTwiceIsRejected) {
  ASSERT_TRUE(scheduler_.start());

  auto again = scheduler_.start();

  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), Error::AlreadyExists);
}

TEST(PeriodicSchedulerStoreTest, StoreOutageDoesNotStopSchedule) {
  FaultyStore store;
  Broker broker(store, fast_broker_options());
  Client client(broker);
  PeriodicScheduler scheduler(client);
  ASSERT_TRUE(scheduler.register_job(cleanup_job(), at(10, 31)));
  store.down = true;

  EXPECT_EQ(scheduler.tick(at(10, 35)), 1u);

  store.down = false;
  EXPECT_EQ(scheduler.tick(at(10, 40)), 1u);
  auto c = store.counts("low", Clock::now());
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->pending, 1);
}

TEST(ScheduledJobsFromConfigTest, ConvertsEachSchedule) {
  SystemConfig config;
  config.schedules.push_back({"0 0 * * *", "cleanup:old_notes",
                              R"({"older_than_days":30})", "low", 2,
                              "purge archived notes"});

  auto jobs = make_scheduled_jobs(config);

  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 1u);
  const auto& job = (*jobs)[0];
  EXPECT_EQ(job.cronspec, "0 0 * * *");
  EXPECT_EQ(job.payload["older_than_days"], 30);
  EXPECT_EQ(job.options.queue, "low");
  EXPECT_EQ(job.options.max_retry, 2);
}

TEST(ScheduledJobsFromConfigTest, BadPayloadIsParseError) {
  SystemConfig config;
  config.schedules.push_back({"@daily", "cleanup:old_notes", "{oops"});

  auto jobs = make_scheduled_jobs(config);

  ASSERT_FALSE(jobs.has_value());
  EXPECT_EQ(jobs.error(), Error::ParseError);
}
