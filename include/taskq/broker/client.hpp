#pragma once

#include "taskq/broker/broker.hpp"
#include "taskq/core/constants.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace taskq {

struct ClientOptions {
  std::string queue{queues::kDefault};
  std::optional<int> max_retry;
  std::chrono::milliseconds process_in{0};
  std::chrono::milliseconds timeout{0};
};

// Producer facade: JSON payloads, queue by name. Task types follow the
// "{domain}:{action}" convention.
class Client {
public:
  explicit Client(Broker& broker) : broker_(broker) {
  }

  [[nodiscard]] auto enqueue(std::string_view type,
                             const nlohmann::json& payload,
                             const ClientOptions& options = {})
      -> Result<TaskId>;

  [[nodiscard]] auto enqueue_critical(std::string_view type,
                                      const nlohmann::json& payload)
      -> Result<TaskId>;
  [[nodiscard]] auto enqueue_default(std::string_view type,
                                     const nlohmann::json& payload)
      -> Result<TaskId>;
  [[nodiscard]] auto enqueue_low(std::string_view type,
                                 const nlohmann::json& payload)
      -> Result<TaskId>;

  // Best-effort enqueue for work the caller never waits on. Lands on "low"
  // unless options name another queue; failures are logged, not returned.
  auto fire_and_forget(std::string_view type, const nlohmann::json& payload)
      -> void;
  auto fire_and_forget(std::string_view type, const nlohmann::json& payload,
                       const ClientOptions& options) -> void;

private:
  Broker& broker_;
};

}  // namespace taskq
