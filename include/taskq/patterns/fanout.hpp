#pragma once

#include "taskq/broker/client.hpp"
#include "taskq/core/error.hpp"
#include "taskq/task/context.hpp"
#include "taskq/task/registry.hpp"
#include "taskq/util/time.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace taskq {

inline constexpr std::string_view kFanoutPrefix = "fanout:";

// One occurrence of a domain event, e.g. "user:created". Every subscriber
// gets its own copy as a separate task.
struct FanoutEvent {
  std::string type;
  nlohmann::json payload;
  std::map<std::string, std::string> metadata;
  // Stamped by publish() when left zero.
  TimePoint timestamp{};
};

void to_json(nlohmann::json& j, const FanoutEvent& e);
void from_json(const nlohmann::json& j, FanoutEvent& e);

using FanoutHandlerFn =
    std::function<HandlerResult(TaskContext&, const FanoutEvent&)>;

struct FanoutHandler {
  std::string id;
  FanoutHandlerFn fn;
  // Queue, retry budget and timeout of the subscriber's task.
  ClientOptions options;
};

struct FanoutFailure {
  std::string handler_id;
  std::error_code error;
};

// "fanout:{event_type}:{handler_id}". Event types may contain ':', handler
// ids may not.
[[nodiscard]] auto fanout_task_type(std::string_view event_type,
                                    std::string_view handler_id)
    -> std::string;

// event type -> subscribers. Each subscriber runs as an independent task on
// its own queue and retries on its own budget, so one failing subscriber
// never holds back the others.
class FanoutRegistry {
public:
  // InvalidArgument for an empty event type, an empty or ':'-containing
  // handler id, or an empty function; AlreadyExists for a repeated id.
  [[nodiscard]] auto register_handler(std::string_view event_type,
                                      std::string_view handler_id,
                                      FanoutHandlerFn fn,
                                      ClientOptions options = {})
      -> Result<void>;
  auto unregister(std::string_view event_type, std::string_view handler_id)
      -> bool;

  [[nodiscard]] auto handlers(std::string_view event_type) const
      -> std::vector<FanoutHandler>;

  // Enqueues one task per subscriber. An event nobody listens to is logged
  // and dropped. The result lists subscribers whose enqueue failed; the
  // rest were enqueued.
  auto publish(Client& client, FanoutEvent event) const
      -> std::vector<FanoutFailure>;

  // Worker side: decodes the event and calls the subscriber named by the
  // task type. Malformed types, payloads and unknown subscribers are not
  // retried.
  [[nodiscard]] auto dispatch(TaskContext& ctx, const Task& task) const
      -> HandlerResult;

  // Registers dispatch() under the task type of every current subscriber.
  // Call before the worker pool freezes the registry.
  [[nodiscard]] auto install(HandlerRegistry& registry) const -> Result<void>;

private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<FanoutHandler>, std::less<>> handlers_;
};

}  // namespace taskq
