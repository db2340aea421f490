#include "taskq/broker/client.hpp"

#include "taskq/task/codec.hpp"
#include "taskq/util/log.hpp"

namespace taskq {

auto Client::enqueue(std::string_view type, const nlohmann::json& payload,
                     const ClientOptions& options) -> Result<TaskId> {
  auto bytes = encode_json(payload);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  EnqueueOptions eo;
  eo.max_retry = options.max_retry;
  eo.process_in = options.process_in;
  eo.timeout = options.timeout;
  return broker_.enqueue(options.queue,
                         NewTask{std::string(type), std::move(*bytes)}, eo);
}

auto Client::enqueue_critical(std::string_view type,
                              const nlohmann::json& payload) -> Result<TaskId> {
  return enqueue(type, payload, {.queue = std::string(queues::kCritical)});
}

auto Client::enqueue_default(std::string_view type,
                             const nlohmann::json& payload) -> Result<TaskId> {
  return enqueue(type, payload, {.queue = std::string(queues::kDefault)});
}

auto Client::enqueue_low(std::string_view type, const nlohmann::json& payload)
    -> Result<TaskId> {
  return enqueue(type, payload, {.queue = std::string(queues::kLow)});
}

auto Client::fire_and_forget(std::string_view type,
                             const nlohmann::json& payload) -> void {
  fire_and_forget(type, payload, {.queue = std::string(queues::kLow)});
}

auto Client::fire_and_forget(std::string_view type,
                             const nlohmann::json& payload,
                             const ClientOptions& options) -> void {
  auto id = enqueue(type, payload, options);
  if (!id) {
    log::error("Fire-and-forget enqueue failed: type={} queue={} error={}",
               type, options.queue, id.error().message());
    return;
  }
  log::debug("Fire-and-forget task enqueued: id={} type={} queue={}", *id,
             type, options.queue);
}

}  // namespace taskq
