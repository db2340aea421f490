#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace taskq {

// Process-local job metrics rendered in the Prometheus text format:
//   taskq_processed_total{task_type,queue,status}   counter
//   taskq_task_duration_seconds{task_type,queue}    histogram
//   taskq_queue_depth{queue}                        gauge
class Metrics {
public:
  static constexpr std::array<double, 11> kDurationBuckets = {
      0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};

  auto record_processed(std::string_view task_type, std::string_view queue,
                        bool success) -> void;
  auto observe_duration(std::string_view task_type, std::string_view queue,
                        double seconds) -> void;
  auto set_queue_depth(std::string_view queue, std::int64_t depth) -> void;

  [[nodiscard]] auto processed(std::string_view task_type,
                               std::string_view queue,
                               std::string_view status) const -> std::uint64_t;
  [[nodiscard]] auto duration_count(std::string_view task_type,
                                    std::string_view queue) const
      -> std::uint64_t;
  [[nodiscard]] auto queue_depth(std::string_view queue) const -> std::int64_t;

  [[nodiscard]] auto render() const -> std::string;

private:
  struct Histogram {
    std::array<std::uint64_t, kDurationBuckets.size()> buckets{};
    std::uint64_t count{0};
    double sum{0.0};
  };

  using ProcessedKey = std::tuple<std::string, std::string, std::string>;
  using DurationKey = std::pair<std::string, std::string>;

  std::map<ProcessedKey, std::uint64_t> processed_;
  std::map<DurationKey, Histogram> durations_;
  std::map<std::string, std::int64_t, std::less<>> depth_;
  mutable std::mutex mu_;
};

}  // namespace taskq
