#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace taskq {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] inline auto to_unix_ms(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_ms(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

// Zero time points render as an empty string.
[[nodiscard]] inline auto to_iso_string(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return {};
  }
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf);
}

}  // namespace taskq
