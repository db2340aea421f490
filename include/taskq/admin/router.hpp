#pragma once

#include "taskq/admin/http_types.hpp"

#include <functional>
#include <string_view>
#include <utility>
#include <vector>

namespace taskq::http {

using Handler = std::function<Response(const Request&)>;

// Patterns are '/'-separated; a "{name}" segment captures into
// Request::path_params. Routes are tried in insertion order.
class Router {
public:
  auto add(Method method, std::string_view pattern, Handler handler) -> void;

  auto get(std::string_view pattern, Handler handler) -> void {
    add(Method::Get, pattern, std::move(handler));
  }
  auto post(std::string_view pattern, Handler handler) -> void {
    add(Method::Post, pattern, std::move(handler));
  }
  auto del(std::string_view pattern, Handler handler) -> void {
    add(Method::Delete, pattern, std::move(handler));
  }

  // 404 when no pattern matches the path, 405 when one does but only under
  // another method.
  [[nodiscard]] auto dispatch(const Request& req) const -> Response;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return routes_.size();
  }

private:
  struct Segment {
    std::string text;
    bool capture{false};
  };

  struct Route {
    Method method;
    std::vector<Segment> segments;
    Handler handler;
  };

  [[nodiscard]] static auto bind(const Route& route,
                                 const std::vector<std::string_view>& parts,
                                 Fields& params) -> bool;

  std::vector<Route> routes_;
};

}  // namespace taskq::http
