#include "taskq/patterns/fanout.hpp"

#include "taskq/task/codec.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>
#include <format>

namespace taskq {

void to_json(nlohmann::json& j, const FanoutEvent& e) {
  j = nlohmann::json{{"type", e.type},
                     {"payload", e.payload},
                     {"timestamp_ms", to_unix_ms(e.timestamp)}};
  if (!e.metadata.empty()) {
    j["metadata"] = e.metadata;
  }
}

void from_json(const nlohmann::json& j, FanoutEvent& e) {
  j.at("type").get_to(e.type);
  e.payload = j.value("payload", nlohmann::json{});
  e.metadata = j.value("metadata", std::map<std::string, std::string>{});
  e.timestamp = from_unix_ms(j.value("timestamp_ms", std::int64_t{0}));
}

auto fanout_task_type(std::string_view event_type, std::string_view handler_id)
    -> std::string {
  return std::format("{}{}:{}", kFanoutPrefix, event_type, handler_id);
}

auto FanoutRegistry::register_handler(std::string_view event_type,
                                      std::string_view handler_id,
                                      FanoutHandlerFn fn,
                                      ClientOptions options) -> Result<void> {
  if (event_type.empty() || handler_id.empty() ||
      handler_id.find(':') != std::string_view::npos || !fn) {
    return taskq::fail(Error::InvalidArgument);
  }
  if (options.queue.empty()) {
    options.queue = std::string(queues::kDefault);
  }

  std::lock_guard lock(mu_);
  auto it = handlers_.find(event_type);
  if (it == handlers_.end()) {
    it = handlers_.emplace(std::string(event_type),
                           std::vector<FanoutHandler>{}).first;
  }
  auto& subs = it->second;
  if (std::ranges::any_of(
          subs, [&](const FanoutHandler& h) { return h.id == handler_id; })) {
    return taskq::fail(Error::AlreadyExists);
  }
  subs.push_back(
      FanoutHandler{std::string(handler_id), std::move(fn), std::move(options)});
  return ok();
}

auto FanoutRegistry::unregister(std::string_view event_type,
                                std::string_view handler_id) -> bool {
  std::lock_guard lock(mu_);
  auto it = handlers_.find(event_type);
  if (it == handlers_.end()) {
    return false;
  }
  return std::erase_if(it->second, [&](const FanoutHandler& h) {
           return h.id == handler_id;
         }) > 0;
}

auto FanoutRegistry::handlers(std::string_view event_type) const
    -> std::vector<FanoutHandler> {
  std::lock_guard lock(mu_);
  auto it = handlers_.find(event_type);
  if (it == handlers_.end()) {
    return {};
  }
  return it->second;
}

auto FanoutRegistry::publish(Client& client, FanoutEvent event) const
    -> std::vector<FanoutFailure> {
  if (event.timestamp == TimePoint{}) {
    event.timestamp = Clock::now();
  }
  auto subs = handlers(event.type);
  if (subs.empty()) {
    log::warn("No fanout handlers registered for event {}", event.type);
    return {};
  }

  nlohmann::json payload = event;
  std::vector<FanoutFailure> failures;
  for (const auto& h : subs) {
    auto type = fanout_task_type(event.type, h.id);
    auto id = client.enqueue(type, payload, h.options);
    if (!id) {
      log::error("Fanout enqueue failed: event={} handler={} error={}",
                 event.type, h.id, id.error().message());
      failures.push_back({h.id, id.error()});
      continue;
    }
    log::debug("Fanout task enqueued: id={} event={} handler={} queue={}", *id,
               event.type, h.id, h.options.queue);
  }
  return failures;
}

auto FanoutRegistry::dispatch(TaskContext& ctx, const Task& task) const
    -> HandlerResult {
  std::string_view type = task.type;
  if (!type.starts_with(kFanoutPrefix)) {
    return skip_retry(std::format("invalid fanout task type: {}", task.type));
  }
  type.remove_prefix(kFanoutPrefix.size());
  auto colon = type.rfind(':');
  if (colon == std::string_view::npos || colon == 0 ||
      colon + 1 == type.size()) {
    return skip_retry(std::format("invalid fanout task type: {}", task.type));
  }
  auto event_type = type.substr(0, colon);
  auto handler_id = type.substr(colon + 1);

  FanoutHandlerFn fn;
  {
    std::lock_guard lock(mu_);
    if (auto it = handlers_.find(event_type); it != handlers_.end()) {
      for (const auto& h : it->second) {
        if (h.id == handler_id) {
          fn = h.fn;
          break;
        }
      }
    }
  }
  if (!fn) {
    log::error("Fanout handler {} not found for event {} task_id={}",
               handler_id, event_type, task.id);
    return skip_retry(std::format("handler {} not found for event {}",
                                  handler_id, event_type));
  }

  auto event = decode_payload<FanoutEvent>(task.payload);
  if (!event) {
    log::error("Undecodable fanout event {} task_id={}: {}", event_type,
               task.id, event.error().message());
    return skip_retry("unmarshal event: " + event.error().message());
  }
  log::debug("Processing fanout event {} handler={} task_id={}", event_type,
             handler_id, task.id);
  return fn(ctx, *event);
}

auto FanoutRegistry::install(HandlerRegistry& registry) const -> Result<void> {
  std::vector<std::string> types;
  {
    std::lock_guard lock(mu_);
    for (const auto& [event_type, subs] : handlers_) {
      for (const auto& h : subs) {
        types.push_back(fanout_task_type(event_type, h.id));
      }
    }
  }
  for (const auto& type : types) {
    auto r = registry.register_handler(
        type, [this](TaskContext& ctx, const Task& task) {
          return dispatch(ctx, task);
        });
    if (!r) {
      return r;
    }
  }
  return ok();
}

}  // namespace taskq
