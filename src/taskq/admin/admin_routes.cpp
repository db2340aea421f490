#include "taskq/admin/admin_routes.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/inspector/queue_inspector.hpp"
#include "taskq/util/log.hpp"
#include "taskq/worker/metrics.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <optional>

namespace taskq::admin {

using json = nlohmann::json;
using http::Request;
using http::Response;
using http::Status;

namespace {

auto dump(const json& j) -> std::string {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto success_response(json data) -> Response {
  json body = {{"success", true}, {"data", std::move(data)}};
  return Response::json(Status::Ok, dump(body));
}

auto parse_positive(const http::Fields& query, std::string_view key)
    -> std::optional<int> {
  auto it = query.find(key);
  if (it == query.end() || it->second.empty()) {
    return std::nullopt;
  }
  const std::string& raw = it->second;
  int value = 0;
  auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (ec != std::errc{} || ptr != raw.data() + raw.size() || value < 1) {
    return std::nullopt;
  }
  return value;
}

auto actor_of(const Request& req) -> std::string {
  auto actor = req.header("X-Actor-ID");
  if (!actor || actor->empty()) {
    return "unknown";
  }
  return std::string(*actor);
}

// Maps inspector errors onto the envelope. Error text from the store is
// logged, never returned.
auto from_error(std::error_code ec, std::string_view action) -> Response {
  if (ec == Error::InvalidQueue) {
    return error_response(Status::BadRequest, kErrBadRequest,
                          "Invalid queue name");
  }
  if (ec == Error::TaskNotFound) {
    return error_response(Status::NotFound, kErrNotFound,
                          "Task not found");
  }
  log::error("Admin {} failed: {}", action, ec.message());
  return error_response(Status::InternalServerError, kErrInternal,
                        "Internal server error");
}

auto queue_param(const Request& req) -> std::string {
  return std::string(req.path_param("queue").value_or(""));
}

auto task_id_param(const Request& req) -> std::string {
  return std::string(req.path_param("task_id").value_or(""));
}

}  // namespace

auto parse_pagination(const http::Fields& query) -> std::pair<int, int> {
  int page = parse_positive(query, "page").value_or(paging::kDefaultPage);
  int page_size =
      parse_positive(query, "page_size").value_or(paging::kDefaultPageSize);
  return normalize_pagination(page, page_size);
}

auto error_response(Status status, std::string_view code,
                    std::string_view message) -> Response {
  json body = {
      {"success", false},
      {"error", {{"code", std::string(code)}, {"message", std::string(message)}}},
  };
  return Response::json(status, dump(body));
}

auto register_admin_routes(http::Router& router, QueueInspector& inspector)
    -> void {
  router.get("/admin/queues/stats", [&inspector](const Request&) {
    auto stats = inspector.get_stats();
    if (!stats) {
      return from_error(stats.error(), "stats");
    }
    return success_response(*stats);
  });

  router.get("/admin/queues/{queue}/jobs", [&inspector](const Request& req) {
    auto queue = queue_param(req);
    auto [page, page_size] = parse_pagination(req.query);
    auto jobs = inspector.list_jobs(queue, page, page_size);
    if (!jobs) {
      return from_error(jobs.error(), "list jobs");
    }
    return success_response(*jobs);
  });

  router.get("/admin/queues/{queue}/failed",
             [&inspector](const Request& req) {
               auto queue = queue_param(req);
               auto [page, page_size] = parse_pagination(req.query);
               auto jobs = inspector.list_failed_jobs(queue, page, page_size);
               if (!jobs) {
                 return from_error(jobs.error(), "list failed jobs");
               }
               return success_response(*jobs);
             });

  router.del("/admin/queues/{queue}/failed/{task_id}",
             [&inspector](const Request& req) {
               auto queue = queue_param(req);
               auto task_id = task_id_param(req);
               if (auto r = inspector.delete_failed_job(queue, task_id); !r) {
                 return from_error(r.error(), "delete");
               }
               log::info("Admin audit action=delete queue={} task_id={} "
                         "actor={}",
                         queue, task_id, actor_of(req));
               return success_response({{"message", "Task deleted"},
                                        {"task_id", task_id},
                                        {"queue", queue}});
             });

  router.post("/admin/queues/{queue}/failed/{task_id}/retry",
              [&inspector](const Request& req) {
                auto queue = queue_param(req);
                auto task_id = task_id_param(req);
                auto job = inspector.retry_failed_job(queue, task_id);
                if (!job) {
                  return from_error(job.error(), "retry");
                }
                log::info("Admin audit action=retry queue={} task_id={} "
                          "actor={}",
                          queue, task_id, actor_of(req));
                return success_response({{"message", "Task queued for retry"},
                                         {"task_id", task_id},
                                         {"queue", queue}});
              });
}

auto register_metrics_route(http::Router& router, Metrics& metrics) -> void {
  router.get("/metrics", [&metrics](const Request&) {
    return Response::text(Status::Ok, metrics.render(),
                          "text/plain; version=0.0.4");
  });
}

}  // namespace taskq::admin
