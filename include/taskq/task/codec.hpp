#pragma once

#include "taskq/core/error.hpp"
#include "taskq/task/task.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace taskq {

using json = nlohmann::json;

[[nodiscard]] auto encode_json(const json& value) -> Result<Bytes>;
[[nodiscard]] auto decode_json(const Bytes& bytes) -> Result<json>;

[[nodiscard]] auto to_bytes(std::string_view s) -> Bytes;
[[nodiscard]] auto to_string(const Bytes& bytes) -> std::string;

// Typed payloads round-trip through nlohmann's to_json/from_json ADL hooks.
template <typename T>
[[nodiscard]] auto encode_payload(const T& value) -> Result<Bytes> {
  try {
    return encode_json(json(value));
  } catch (const json::exception&) {
    return fail(Error::SerializationFailed);
  }
}

template <typename T>
[[nodiscard]] auto decode_payload(const Bytes& bytes) -> Result<T> {
  auto j = decode_json(bytes);
  if (!j) {
    return std::unexpected(j.error());
  }
  try {
    return j->template get<T>();
  } catch (const json::exception&) {
    return fail(Error::SerializationFailed);
  }
}

}  // namespace taskq
