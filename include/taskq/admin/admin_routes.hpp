#pragma once

#include "taskq/admin/http_types.hpp"
#include "taskq/admin/router.hpp"

#include <string_view>
#include <utility>

namespace taskq {

class QueueInspector;
class Metrics;

namespace admin {

// Envelope codes.
inline constexpr std::string_view kErrBadRequest = "ERR_BAD_REQUEST";
inline constexpr std::string_view kErrNotFound = "ERR_NOT_FOUND";
inline constexpr std::string_view kErrInternal = "ERR_INTERNAL";

// Mounts the /admin/queues endpoints. The inspector must outlive the router.
auto register_admin_routes(http::Router& router, QueueInspector& inspector)
    -> void;

// GET /metrics in Prometheus text format.
auto register_metrics_route(http::Router& router, Metrics& metrics) -> void;

// Reads ?page and ?page_size; anything unparsable or non-positive falls back
// to the default, page_size is capped.
[[nodiscard]] auto parse_pagination(const http::Fields& query)
    -> std::pair<int, int>;

[[nodiscard]] auto error_response(http::Status status,
                                  std::string_view code,
                                  std::string_view message) -> http::Response;

}  // namespace admin
}  // namespace taskq
