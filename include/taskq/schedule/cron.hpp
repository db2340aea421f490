#pragma once

#include "taskq/core/error.hpp"
#include "taskq/util/time.hpp"

#include <bitset>
#include <chrono>
#include <string>
#include <string_view>

namespace taskq {

// Five-field cron expression: minute hour day-of-month month day-of-week,
// evaluated in UTC. Fields take lists, ranges, steps ("*/15", "5/10"),
// month and weekday names; 7 is also Sunday. The @yearly, @monthly,
// @weekly, @daily and @hourly macros expand to their usual forms.
class CronSchedule {
public:
  CronSchedule() = default;

  [[nodiscard]] static auto parse(std::string_view spec)
      -> Result<CronSchedule>;

  // First matching minute strictly after `after`, or TimePoint::max() when
  // nothing matches within five years (e.g. "0 0 31 2 *").
  [[nodiscard]] auto next_after(TimePoint after) const -> TimePoint;

  [[nodiscard]] auto spec() const noexcept -> std::string_view {
    return spec_;
  }

private:
  struct Field {
    std::bitset<64> allowed;
    bool wildcard{true};

    [[nodiscard]] auto has(unsigned v) const -> bool {
      return v < allowed.size() && allowed.test(v);
    }
  };

  [[nodiscard]] auto day_matches(std::chrono::year_month_day ymd,
                                 std::chrono::weekday wd) const -> bool;

  std::string spec_;
  Field minute_;
  Field hour_;
  Field dom_;
  Field month_;
  Field dow_;
};

// ParseError (with the offending expression logged) unless `spec` parses.
[[nodiscard]] auto validate_cronspec(std::string_view spec) -> Result<void>;

}  // namespace taskq
