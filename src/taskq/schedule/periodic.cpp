#include "taskq/schedule/periodic.hpp"

#include "taskq/util/id.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>

namespace taskq {
namespace {

// Upper bound on one sleep, so jobs registered while running are picked up.
constexpr auto kMaxIdle = std::chrono::seconds(1);
constexpr auto kMinIdle = std::chrono::milliseconds(10);

}  // namespace

PeriodicScheduler::~PeriodicScheduler() {
  stop();
}

auto PeriodicScheduler::register_job(ScheduledJob job, TimePoint now)
    -> Result<std::string> {
  if (job.type.empty()) {
    return taskq::fail(Error::InvalidArgument);
  }
  auto schedule = CronSchedule::parse(job.cronspec);
  if (!schedule) {
    log::error("Cannot register scheduled job {} ({}): invalid cron '{}'",
               job.type, job.description, job.cronspec);
    return std::unexpected(schedule.error());
  }

  Entry entry{ScheduledEntry{ids::uuid_v4(), std::move(job),
                             schedule->next_after(now), TimePoint{}},
              std::move(*schedule)};
  auto id = entry.info.id;
  log::info("Registered scheduled job: id={} type={} cron='{}' next={} {}",
            id, entry.info.job.type, entry.info.job.cronspec,
            to_iso_string(entry.info.next_run), entry.info.job.description);

  std::lock_guard lock(mu_);
  entries_.push_back(std::move(entry));
  return ok(std::move(id));
}

auto PeriodicScheduler::register_jobs(std::vector<ScheduledJob> jobs)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> ids;
  ids.reserve(jobs.size());
  for (auto& job : jobs) {
    auto id = register_job(std::move(job));
    if (!id) {
      return std::unexpected(id.error());
    }
    ids.push_back(std::move(*id));
  }
  return ok(std::move(ids));
}

auto PeriodicScheduler::unregister(std::string_view id) -> bool {
  std::lock_guard lock(mu_);
  auto removed = std::erase_if(
      entries_, [id](const Entry& e) { return e.info.id == id; });
  return removed > 0;
}

auto PeriodicScheduler::tick(TimePoint now) -> std::size_t {
  std::vector<ScheduledJob> due;
  {
    std::lock_guard lock(mu_);
    for (auto& e : entries_) {
      if (e.info.next_run > now) {
        continue;
      }
      due.push_back(e.info.job);
      e.info.last_run = now;
      e.info.next_run = e.schedule.next_after(now);
    }
  }

  for (const auto& job : due) {
    auto id = client_.enqueue(job.type, job.payload, job.options);
    if (!id) {
      log::error("Scheduler failed to enqueue {}: {}", job.type,
                 id.error().message());
      continue;
    }
    log::debug("Scheduler enqueued task: id={} type={} queue={}", *id,
               job.type, job.options.queue);
  }
  return due.size();
}

auto PeriodicScheduler::next_run() const -> TimePoint {
  std::lock_guard lock(mu_);
  auto next = TimePoint::max();
  for (const auto& e : entries_) {
    next = std::min(next, e.info.next_run);
  }
  return next;
}

auto PeriodicScheduler::entries() const -> std::vector<ScheduledEntry> {
  std::lock_guard lock(mu_);
  std::vector<ScheduledEntry> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    out.push_back(e.info);
  }
  return out;
}

auto PeriodicScheduler::start() -> Result<void> {
  if (running_.exchange(true)) {
    return taskq::fail(Error::AlreadyExists);
  }
  stop_source_ = CancellationSource{};
  thread_ = std::thread([this] { loop(); });
  std::size_t count;
  {
    std::lock_guard lock(mu_);
    count = entries_.size();
  }
  log::info("Scheduler started: jobs={}", count);
  return ok();
}

auto PeriodicScheduler::run(const CancellationToken& token) -> Result<void> {
  if (auto r = start(); !r) {
    return r;
  }
  while (!token.wait_for(std::chrono::seconds(1))) {
  }
  stop();
  return ok();
}

auto PeriodicScheduler::stop() -> void {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  stop_source_.cancel(CancelReason::Shutdown);
  if (thread_.joinable()) {
    thread_.join();
  }
  running_.store(false, std::memory_order_release);
  log::info("Scheduler stopped");
}

auto PeriodicScheduler::loop() -> void {
  auto token = stop_source_.token();
  while (!token.is_cancelled()) {
    auto now = Clock::now();
    tick(now);

    std::chrono::milliseconds idle = kMaxIdle;
    if (auto next = next_run(); next != TimePoint::max()) {
      idle = std::clamp(
          std::chrono::duration_cast<std::chrono::milliseconds>(next - now),
          kMinIdle, idle);
    }
    if (token.wait_for(idle)) {
      break;
    }
  }
}

}  // namespace taskq
