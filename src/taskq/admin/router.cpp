#include "taskq/admin/router.hpp"

#include <ranges>

namespace taskq::http {

namespace {

auto split_segments(std::string_view path) -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  for (auto piece : path | std::views::split('/')) {
    std::string_view sv{piece.begin(), piece.end()};
    if (!sv.empty()) {
      parts.push_back(sv);
    }
  }
  return parts;
}

}  // namespace

auto Router::add(Method method, std::string_view pattern, Handler handler)
    -> void {
  Route route{method, {}, std::move(handler)};
  for (auto part : split_segments(pattern)) {
    if (part.size() > 2 && part.front() == '{' && part.back() == '}') {
      route.segments.push_back({std::string(part.substr(1, part.size() - 2)),
                                true});
    } else {
      route.segments.push_back({std::string(part), false});
    }
  }
  routes_.push_back(std::move(route));
}

auto Router::bind(const Route& route,
                  const std::vector<std::string_view>& parts, Fields& params)
    -> bool {
  if (route.segments.size() != parts.size()) {
    return false;
  }
  params.clear();
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto& seg = route.segments[i];
    if (seg.capture) {
      params[seg.text] = std::string(parts[i]);
    } else if (seg.text != parts[i]) {
      return false;
    }
  }
  return true;
}

auto Router::dispatch(const Request& req) const -> Response {
  auto parts = split_segments(req.path);
  bool other_method = false;
  Fields params;

  for (const auto& route : routes_) {
    if (!bind(route, parts, params)) {
      continue;
    }
    if (route.method != req.method) {
      other_method = true;
      continue;
    }
    Request bound = req;
    bound.path_params = std::move(params);
    return route.handler(bound);
  }

  return Response::empty(other_method ? Status::MethodNotAllowed
                                      : Status::NotFound);
}

}  // namespace taskq::http
