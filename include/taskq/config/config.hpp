#pragma once

#include "taskq/config/system_config.hpp"
#include "taskq/core/error.hpp"

#include <string>
#include <string_view>

namespace taskq {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

// Rejects configurations the worker pool and broker cannot run with:
// no queues, duplicate or empty queue names, non-positive weights,
// concurrency or timeouts, and schedules with a bad cron expression, an
// unknown queue or a payload that is not JSON.
[[nodiscard]] auto validate(const SystemConfig& config) -> Result<void>;

}  // namespace taskq
