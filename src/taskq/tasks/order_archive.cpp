#include "taskq/tasks/order_archive.hpp"

#include "taskq/task/codec.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace taskq::tasks {

void to_json(nlohmann::json& j, const OrderArchivePayload& p) {
  j = nlohmann::json{{"order_id", p.order_id}};
}

void from_json(const nlohmann::json& j, OrderArchivePayload& p) {
  p.order_id = j.value("order_id", std::string{});
}

auto is_valid_order_id(std::string_view id) -> bool {
  constexpr std::array<std::size_t, 4> kDashes = {8, 13, 18, 23};
  if (id.size() != 36) {
    return false;
  }
  bool all_zero = true;
  for (std::size_t i = 0; i < id.size(); ++i) {
    char c = id[i];
    if (std::ranges::find(kDashes, i) != kDashes.end()) {
      if (c != '-') {
        return false;
      }
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    all_zero = all_zero && c == '0';
  }
  return !all_zero;
}

auto make_order_archive_task(std::string_view order_id) -> Result<NewTask> {
  auto payload = encode_payload(OrderArchivePayload{std::string(order_id)});
  if (!payload) {
    return std::unexpected(payload.error());
  }
  return NewTask{std::string(kOrderArchive), std::move(*payload)};
}

auto handle_order_archive(TaskContext& ctx, const Task& task)
    -> HandlerResult {
  auto payload = decode_payload<OrderArchivePayload>(task.payload);
  if (!payload) {
    log::error("invalid payload task_type={} task_id={}: {}", task.type,
               task.id, payload.error().message());
    return skip_retry("unmarshal payload: " + payload.error().message());
  }
  if (!is_valid_order_id(payload->order_id)) {
    log::error("missing order_id task_type={} task_id={}", task.type, task.id);
    return skip_retry("order_id is required");
  }
  if (ctx.is_cancelled()) {
    return retryable("cancelled before archive");
  }

  log::info("archiving order task_type={} task_id={} order_id={}", task.type,
            task.id, payload->order_id);
  ctx.set_result(to_bytes(payload->order_id));
  log::info("order archived task_type={} task_id={} order_id={}", task.type,
            task.id, payload->order_id);
  return {};
}

auto register_builtin_handlers(HandlerRegistry& registry,
                               IdempotencyGuard& guard,
                               std::chrono::milliseconds ttl) -> Result<void> {
  return registry.register_handler(
      kOrderArchive,
      make_idempotent(handle_order_archive, guard, IdempotentOptions{.ttl = ttl}));
}

}  // namespace taskq::tasks
