#pragma once

#include "taskq/broker/broker.hpp"
#include "taskq/core/error.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskq {

struct AggregateStats {
  std::int64_t total_enqueued{0};
  std::int64_t total_active{0};
  std::int64_t total_pending{0};
  std::int64_t total_scheduled{0};
  std::int64_t total_retry{0};
  std::int64_t total_failed{0};
  std::int64_t total_completed{0};
  std::int64_t total_processed{0};
  std::int64_t total_errored{0};
};

struct QueueInfo {
  std::string name;
  int weight{1};
  std::int64_t size{0};
  std::int64_t active{0};
  std::int64_t pending{0};
  std::int64_t scheduled{0};
  std::int64_t retry{0};
  std::int64_t failed{0};
  std::int64_t completed{0};
  std::int64_t processed{0};
  std::int64_t errored{0};
};

struct QueueStats {
  AggregateStats aggregate;
  std::vector<QueueInfo> queues;
};

struct JobInfo {
  std::string task_id;
  std::string type;
  std::string payload_preview;
  std::string state;
  std::string queue;
  int max_retry{0};
  int retried{0};
  TimePoint created_at{};
  TimePoint process_at{};
};

struct FailedJobInfo {
  std::string task_id;
  std::string type;
  std::string payload_preview;
  std::string error_message;
  TimePoint failed_at{};
  int retry_count{0};
  int max_retry{0};
};

struct Pagination {
  int page{1};
  int page_size{20};
  std::int64_t total{0};
  std::int64_t total_pages{1};
};

struct JobList {
  std::vector<JobInfo> jobs;
  Pagination pagination;
};

struct FailedJobList {
  std::vector<FailedJobInfo> failed_jobs;
  Pagination pagination;
};

// page < 1 -> 1; page_size < 1 -> default; page_size > max -> max.
[[nodiscard]] auto normalize_pagination(int page, int page_size)
    -> std::pair<int, int>;
[[nodiscard]] auto make_pagination(int page, int page_size, std::int64_t total)
    -> Pagination;
// First 100 bytes, with "..." appended when truncated.
[[nodiscard]] auto payload_preview(const Bytes& payload) -> std::string;

// Read and repair operations over the broker's queues for operators.
// Queue names are checked against the configured set (InvalidQueue).
class QueueInspector {
public:
  explicit QueueInspector(Broker& broker) : broker_(broker) {
  }

  [[nodiscard]] auto get_stats() -> Result<QueueStats>;
  [[nodiscard]] auto list_jobs(std::string_view queue, int page, int page_size)
      -> Result<JobList>;
  [[nodiscard]] auto list_failed_jobs(std::string_view queue, int page,
                                      int page_size) -> Result<FailedJobList>;
  // Failed -> Pending with a fresh retry budget.
  [[nodiscard]] auto retry_failed_job(std::string_view queue,
                                      std::string_view task_id)
      -> Result<JobInfo>;
  [[nodiscard]] auto delete_failed_job(std::string_view queue,
                                       std::string_view task_id)
      -> Result<void>;

  [[nodiscard]] auto is_valid_queue(std::string_view queue) const -> bool {
    return broker_.has_queue(queue);
  }

private:
  Broker& broker_;
};

void to_json(nlohmann::json& j, const AggregateStats& s);
void to_json(nlohmann::json& j, const QueueInfo& q);
void to_json(nlohmann::json& j, const QueueStats& s);
void to_json(nlohmann::json& j, const JobInfo& job);
void to_json(nlohmann::json& j, const FailedJobInfo& job);
void to_json(nlohmann::json& j, const Pagination& p);
void to_json(nlohmann::json& j, const JobList& list);
void to_json(nlohmann::json& j, const FailedJobList& list);

}  // namespace taskq
