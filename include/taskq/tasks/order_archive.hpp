#pragma once

#include "taskq/idempotency/guard.hpp"
#include "taskq/task/context.hpp"
#include "taskq/task/registry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>

namespace taskq::tasks {

inline constexpr std::string_view kOrderArchive = "order:archive";
inline constexpr int kOrderArchiveMaxRetry = 3;

struct OrderArchivePayload {
  std::string order_id;
};

void to_json(nlohmann::json& j, const OrderArchivePayload& p);
void from_json(const nlohmann::json& j, OrderArchivePayload& p);

// 8-4-4-4-12 hex, not the nil uuid.
[[nodiscard]] auto is_valid_order_id(std::string_view id) -> bool;

[[nodiscard]] auto make_order_archive_task(std::string_view order_id)
    -> Result<NewTask>;

// Rejects undecodable payloads and bad ids as validation failures.
[[nodiscard]] auto handle_order_archive(TaskContext& ctx, const Task& task)
    -> HandlerResult;

// Registers every built-in handler, each behind the idempotency guard.
[[nodiscard]] auto register_builtin_handlers(HandlerRegistry& registry,
                                             IdempotencyGuard& guard,
                                             std::chrono::milliseconds ttl)
    -> Result<void>;

}  // namespace taskq::tasks
