#include "taskq/worker/metrics.hpp"

#include <format>
#include <iterator>

namespace taskq {

auto Metrics::record_processed(std::string_view task_type,
                               std::string_view queue, bool success) -> void {
  std::lock_guard lock(mu_);
  ++processed_[ProcessedKey{task_type, queue, success ? "success" : "failed"}];
}

auto Metrics::observe_duration(std::string_view task_type,
                               std::string_view queue, double seconds)
    -> void {
  std::lock_guard lock(mu_);
  auto& h = durations_[DurationKey{task_type, queue}];
  for (std::size_t i = 0; i < kDurationBuckets.size(); ++i) {
    if (seconds <= kDurationBuckets[i]) {
      ++h.buckets[i];
    }
  }
  ++h.count;
  h.sum += seconds;
}

auto Metrics::set_queue_depth(std::string_view queue, std::int64_t depth)
    -> void {
  std::lock_guard lock(mu_);
  depth_.insert_or_assign(std::string(queue), depth);
}

auto Metrics::processed(std::string_view task_type, std::string_view queue,
                        std::string_view status) const -> std::uint64_t {
  std::lock_guard lock(mu_);
  auto it = processed_.find(ProcessedKey{task_type, queue, status});
  return it != processed_.end() ? it->second : 0;
}

auto Metrics::duration_count(std::string_view task_type,
                             std::string_view queue) const -> std::uint64_t {
  std::lock_guard lock(mu_);
  auto it = durations_.find(DurationKey{task_type, queue});
  return it != durations_.end() ? it->second.count : 0;
}

auto Metrics::queue_depth(std::string_view queue) const -> std::int64_t {
  std::lock_guard lock(mu_);
  auto it = depth_.find(queue);
  return it != depth_.end() ? it->second : 0;
}

auto Metrics::render() const -> std::string {
  std::lock_guard lock(mu_);
  std::string out;
  auto it = std::back_inserter(out);

  std::format_to(it, "# HELP taskq_processed_total Total processed tasks.\n"
                     "# TYPE taskq_processed_total counter\n");
  for (const auto& [key, value] : processed_) {
    const auto& [type, queue, status] = key;
    std::format_to(it,
                   "taskq_processed_total{{task_type=\"{}\",queue=\"{}\","
                   "status=\"{}\"}} {}\n",
                   type, queue, status, value);
  }

  std::format_to(it,
                 "# HELP taskq_task_duration_seconds Task processing time.\n"
                 "# TYPE taskq_task_duration_seconds histogram\n");
  for (const auto& [key, h] : durations_) {
    const auto& [type, queue] = key;
    for (std::size_t i = 0; i < kDurationBuckets.size(); ++i) {
      std::format_to(it,
                     "taskq_task_duration_seconds_bucket{{task_type=\"{}\","
                     "queue=\"{}\",le=\"{}\"}} {}\n",
                     type, queue, kDurationBuckets[i], h.buckets[i]);
    }
    std::format_to(it,
                   "taskq_task_duration_seconds_bucket{{task_type=\"{}\","
                   "queue=\"{}\",le=\"+Inf\"}} {}\n",
                   type, queue, h.count);
    std::format_to(it,
                   "taskq_task_duration_seconds_sum{{task_type=\"{}\","
                   "queue=\"{}\"}} {}\n",
                   type, queue, h.sum);
    std::format_to(it,
                   "taskq_task_duration_seconds_count{{task_type=\"{}\","
                   "queue=\"{}\"}} {}\n",
                   type, queue, h.count);
  }

  std::format_to(it, "# HELP taskq_queue_depth Tasks waiting per queue.\n"
                     "# TYPE taskq_queue_depth gauge\n");
  for (const auto& [queue, depth] : depth_) {
    std::format_to(it, "taskq_queue_depth{{queue=\"{}\"}} {}\n", queue, depth);
  }
  return out;
}

}  // namespace taskq
