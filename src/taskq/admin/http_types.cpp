#include "taskq/admin/http_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace taskq::http {

namespace {

constexpr std::array<std::pair<Method, std::string_view>, 5> kMethods = {{
    {Method::Get, "GET"},
    {Method::Post, "POST"},
    {Method::Put, "PUT"},
    {Method::Delete, "DELETE"},
    {Method::Patch, "PATCH"},
}};

auto same_name(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

auto hex_value(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto decode_component(std::string_view raw) -> std::string {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    char c = raw[i];
    if (c == '+') {
      out.push_back(' ');
      continue;
    }
    if (c == '%' && i + 2 < raw.size()) {
      int hi = hex_value(raw[i + 1]);
      int lo = hex_value(raw[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

auto find_field(const Fields& fields, std::string_view key)
    -> std::optional<std::string_view> {
  if (auto it = fields.find(key); it != fields.end()) {
    return std::string_view{it->second};
  }
  return std::nullopt;
}

}  // namespace

auto method_name(Method method) noexcept -> std::string_view {
  for (const auto& [m, name] : kMethods) {
    if (m == method) {
      return name;
    }
  }
  return "UNKNOWN";
}

auto parse_method(std::string_view name) -> std::optional<Method> {
  for (const auto& [m, known] : kMethods) {
    if (same_name(known, name)) {
      return m;
    }
  }
  return std::nullopt;
}

auto reason_phrase(Status status) noexcept -> std::string_view {
  switch (status) {
    case Status::Ok: return "OK";
    case Status::NoContent: return "No Content";
    case Status::BadRequest: return "Bad Request";
    case Status::NotFound: return "Not Found";
    case Status::MethodNotAllowed: return "Method Not Allowed";
    case Status::InternalServerError: return "Internal Server Error";
    case Status::ServiceUnavailable: return "Service Unavailable";
  }
  return "Unknown";
}

auto parse_query(std::string_view query) -> Fields {
  Fields fields;
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{}
                                          : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    auto key = decode_component(pair.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    fields[std::move(key)] = eq == std::string_view::npos
                                 ? std::string{}
                                 : decode_component(pair.substr(eq + 1));
  }
  return fields;
}

auto Request::from_target(Method method, std::string_view target) -> Request {
  Request req;
  req.method = method;
  auto qmark = target.find('?');
  req.path = std::string(target.substr(0, qmark));
  if (qmark != std::string_view::npos) {
    req.query = parse_query(target.substr(qmark + 1));
  }
  return req;
}

auto Request::header(std::string_view name) const
    -> std::optional<std::string_view> {
  if (auto exact = find_field(headers, name)) {
    return exact;
  }
  for (const auto& [key, value] : headers) {
    if (same_name(key, name)) {
      return std::string_view{value};
    }
  }
  return std::nullopt;
}

auto Request::query_param(std::string_view key) const
    -> std::optional<std::string_view> {
  return find_field(query, key);
}

auto Request::path_param(std::string_view key) const
    -> std::optional<std::string_view> {
  return find_field(path_params, key);
}

auto Response::json(Status status, std::string body) -> Response {
  return text(status, std::move(body), "application/json");
}

auto Response::text(Status status, std::string body,
                    std::string_view content_type) -> Response {
  Response resp{status, {}, std::move(body)};
  resp.headers.emplace("Content-Type", std::string(content_type));
  return resp;
}

auto Response::empty(Status status) -> Response {
  return Response{status, {}, {}};
}

auto Response::content_type() const -> std::string_view {
  return find_field(headers, "Content-Type").value_or("");
}

}  // namespace taskq::http
