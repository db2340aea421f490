#pragma once

#include "taskq/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace taskq::http {

enum class Method : std::uint8_t {
  Get,
  Post,
  Put,
  Delete,
  Patch,
};

enum class Status : std::uint16_t {
  Ok = 200,
  NoContent = 204,
  BadRequest = 400,
  NotFound = 404,
  MethodNotAllowed = 405,
  InternalServerError = 500,
  ServiceUnavailable = 503,
};

using Fields =
    std::unordered_map<std::string, std::string, StringHash, StringEqual>;

[[nodiscard]] auto method_name(Method method) noexcept -> std::string_view;
[[nodiscard]] auto parse_method(std::string_view name) -> std::optional<Method>;
[[nodiscard]] auto reason_phrase(Status status) noexcept -> std::string_view;

// "a=1&b=x%20y&flag" -> {a: "1", b: "x y", flag: ""}. '+' decodes to a space;
// a malformed escape is kept verbatim.
[[nodiscard]] auto parse_query(std::string_view query) -> Fields;

// An admin call with the transport stripped off: whatever front end serves
// the routes fills one of these in.
struct Request {
  Method method{Method::Get};
  std::string path;
  Fields query;
  Fields headers;
  // Filled by the router from "{name}" segments.
  Fields path_params;
  std::string body;

  // Splits "path?query" into path and decoded query fields.
  [[nodiscard]] static auto from_target(Method method, std::string_view target)
      -> Request;

  // Header names compare case-insensitively.
  [[nodiscard]] auto header(std::string_view name) const
      -> std::optional<std::string_view>;
  [[nodiscard]] auto query_param(std::string_view key) const
      -> std::optional<std::string_view>;
  [[nodiscard]] auto path_param(std::string_view key) const
      -> std::optional<std::string_view>;
};

struct Response {
  Status status{Status::Ok};
  Fields headers;
  std::string body;

  [[nodiscard]] static auto json(Status status, std::string body) -> Response;
  [[nodiscard]] static auto text(Status status, std::string body,
                                 std::string_view content_type = "text/plain")
      -> Response;
  [[nodiscard]] static auto empty(Status status) -> Response;

  [[nodiscard]] auto content_type() const -> std::string_view;
};

}  // namespace taskq::http

template <>
struct std::formatter<taskq::http::Method> : std::formatter<std::string_view> {
  auto format(taskq::http::Method method, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        taskq::http::method_name(method), ctx);
  }
};

template <>
struct std::formatter<taskq::http::Status> : std::formatter<std::uint16_t> {
  auto format(taskq::http::Status status, auto& ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
