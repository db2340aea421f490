#include "taskq/inspector/queue_inspector.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/task/state_strings.hpp"
#include "taskq/util/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <tuple>

namespace taskq {

namespace {

auto to_job_info(const Task& t, TimePoint now) -> JobInfo {
  return JobInfo{
      .task_id = t.id.str(),
      .type = t.type,
      .payload_preview = payload_preview(t.payload),
      .state = std::string(task_state_name(effective_state(t, now))),
      .queue = t.queue,
      .max_retry = t.max_retry,
      .retried = t.retry_count,
      .created_at = t.enqueued_at,
      .process_at = t.process_at,
  };
}

auto to_failed_job_info(const Task& t) -> FailedJobInfo {
  return FailedJobInfo{
      .task_id = t.id.str(),
      .type = t.type,
      .payload_preview = payload_preview(t.payload),
      .error_message = t.last_error,
      .failed_at = t.last_failed_at,
      .retry_count = t.retry_count,
      .max_retry = t.max_retry,
  };
}

auto offset_of(int page, int page_size) -> std::size_t {
  return static_cast<std::size_t>(page - 1) *
         static_cast<std::size_t>(page_size);
}

auto as_inspector_error(std::error_code ec) -> std::error_code {
  if (ec == Error::TaskNotFound || ec == Error::InvalidQueue) {
    return ec;
  }
  return make_error_code(Error::BrokerUnavailable);
}

}  // namespace

auto normalize_pagination(int page, int page_size) -> std::pair<int, int> {
  if (page < 1) {
    page = paging::kDefaultPage;
  }
  if (page_size < 1) {
    page_size = paging::kDefaultPageSize;
  }
  page_size = std::min(page_size, paging::kMaxPageSize);
  return {page, page_size};
}

auto make_pagination(int page, int page_size, std::int64_t total)
    -> Pagination {
  auto total_pages = (total + page_size - 1) / page_size;
  return Pagination{page, page_size, total, std::max<std::int64_t>(1, total_pages)};
}

auto payload_preview(const Bytes& payload) -> std::string {
  if (payload.size() <= paging::kPayloadPreviewLen) {
    return std::string(payload.begin(), payload.end());
  }
  return std::string(payload.begin(),
                     payload.begin() + paging::kPayloadPreviewLen) +
         "...";
}

auto QueueInspector::get_stats() -> Result<QueueStats> {
  QueueStats stats;
  auto now = Clock::now();
  auto& agg = stats.aggregate;

  for (const auto& q : broker_.queues()) {
    auto counts = broker_.store().counts(q.name, now);
    if (!counts) {
      log::error("Failed to read stats for queue '{}': {}", q.name,
                 counts.error().message());
      return std::unexpected(as_inspector_error(counts.error()));
    }
    const auto& c = *counts;
    QueueInfo info{
        .name = q.name,
        .weight = q.weight,
        .size = c.pending + c.scheduled + c.retry + c.active + c.failed +
                c.completed,
        .active = c.active,
        .pending = c.pending,
        .scheduled = c.scheduled,
        .retry = c.retry,
        .failed = c.failed,
        .completed = c.completed,
        .processed = c.processed,
        .errored = c.failed_total,
    };

    agg.total_enqueued += info.size;
    agg.total_active += info.active;
    agg.total_pending += info.pending;
    agg.total_scheduled += info.scheduled;
    agg.total_retry += info.retry;
    agg.total_failed += info.failed;
    agg.total_completed += info.completed;
    agg.total_processed += info.processed;
    agg.total_errored += info.errored;
    stats.queues.push_back(std::move(info));
  }
  return stats;
}

auto QueueInspector::list_jobs(std::string_view queue, int page, int page_size)
    -> Result<JobList> {
  if (!is_valid_queue(queue)) {
    return fail(Error::InvalidQueue);
  }
  std::tie(page, page_size) = normalize_pagination(page, page_size);
  auto now = Clock::now();

  auto tasks = broker_.store().list(queue, TaskFilter::Queued,
                                    offset_of(page, page_size),
                                    static_cast<std::size_t>(page_size));
  if (!tasks) {
    return std::unexpected(as_inspector_error(tasks.error()));
  }
  auto counts = broker_.store().counts(queue, now);
  if (!counts) {
    return std::unexpected(as_inspector_error(counts.error()));
  }

  JobList list;
  list.jobs.reserve(tasks->size());
  for (const auto& t : *tasks) {
    list.jobs.push_back(to_job_info(t, now));
  }
  auto total =
      counts->pending + counts->scheduled + counts->retry + counts->active;
  list.pagination = make_pagination(page, page_size, total);
  return list;
}

auto QueueInspector::list_failed_jobs(std::string_view queue, int page,
                                      int page_size) -> Result<FailedJobList> {
  if (!is_valid_queue(queue)) {
    return fail(Error::InvalidQueue);
  }
  std::tie(page, page_size) = normalize_pagination(page, page_size);

  auto tasks = broker_.store().list(queue, TaskFilter::Failed,
                                    offset_of(page, page_size),
                                    static_cast<std::size_t>(page_size));
  if (!tasks) {
    return std::unexpected(as_inspector_error(tasks.error()));
  }
  auto counts = broker_.store().counts(queue, Clock::now());
  if (!counts) {
    return std::unexpected(as_inspector_error(counts.error()));
  }

  FailedJobList list;
  list.failed_jobs.reserve(tasks->size());
  for (const auto& t : *tasks) {
    list.failed_jobs.push_back(to_failed_job_info(t));
  }
  list.pagination = make_pagination(page, page_size, counts->failed);
  return list;
}

auto QueueInspector::retry_failed_job(std::string_view queue,
                                      std::string_view task_id)
    -> Result<JobInfo> {
  if (!is_valid_queue(queue)) {
    return fail(Error::InvalidQueue);
  }
  auto now = Clock::now();
  auto task = broker_.store().requeue_failed(queue, task_id, now);
  if (!task) {
    return std::unexpected(as_inspector_error(task.error()));
  }
  broker_.notify_all();
  log::info("Failed task requeued task_id={} queue={}", task_id, queue);
  return to_job_info(*task, now);
}

auto QueueInspector::delete_failed_job(std::string_view queue,
                                       std::string_view task_id)
    -> Result<void> {
  if (!is_valid_queue(queue)) {
    return fail(Error::InvalidQueue);
  }
  if (auto r = broker_.store().delete_failed(queue, task_id); !r) {
    return std::unexpected(as_inspector_error(r.error()));
  }
  log::info("Failed task deleted task_id={} queue={}", task_id, queue);
  return ok();
}

void to_json(nlohmann::json& j, const AggregateStats& s) {
  j = {
      {"total_enqueued", s.total_enqueued},
      {"total_active", s.total_active},
      {"total_pending", s.total_pending},
      {"total_scheduled", s.total_scheduled},
      {"total_retry", s.total_retry},
      {"total_failed", s.total_failed},
      {"total_completed", s.total_completed},
      {"total_processed", s.total_processed},
      {"total_errored", s.total_errored},
  };
}

void to_json(nlohmann::json& j, const QueueInfo& q) {
  j = {
      {"name", q.name},           {"weight", q.weight},
      {"size", q.size},           {"active", q.active},
      {"pending", q.pending},     {"scheduled", q.scheduled},
      {"retry", q.retry},         {"failed", q.failed},
      {"completed", q.completed}, {"processed", q.processed},
      {"errored", q.errored},
  };
}

void to_json(nlohmann::json& j, const QueueStats& s) {
  j = {{"aggregate", s.aggregate}, {"queues", s.queues}};
}

void to_json(nlohmann::json& j, const JobInfo& job) {
  j = {
      {"task_id", job.task_id},
      {"type", job.type},
      {"payload_preview", job.payload_preview},
      {"state", job.state},
      {"queue", job.queue},
      {"max_retry", job.max_retry},
      {"retried", job.retried},
      {"created_at", to_iso_string(job.created_at)},
      {"process_at", to_iso_string(job.process_at)},
  };
}

void to_json(nlohmann::json& j, const FailedJobInfo& job) {
  j = {
      {"task_id", job.task_id},
      {"type", job.type},
      {"payload_preview", job.payload_preview},
      {"error_message", job.error_message},
      {"failed_at", to_iso_string(job.failed_at)},
      {"retry_count", job.retry_count},
      {"max_retry", job.max_retry},
  };
}

void to_json(nlohmann::json& j, const Pagination& p) {
  j = {
      {"page", p.page},
      {"page_size", p.page_size},
      {"total", p.total},
      {"total_pages", p.total_pages},
  };
}

void to_json(nlohmann::json& j, const JobList& list) {
  j = {{"jobs", list.jobs}, {"pagination", list.pagination}};
}

void to_json(nlohmann::json& j, const FailedJobList& list) {
  j = {{"failed_jobs", list.failed_jobs}, {"pagination", list.pagination}};
}

}  // namespace taskq
