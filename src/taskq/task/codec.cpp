#include "taskq/task/codec.hpp"

#include "taskq/util/log.hpp"

namespace taskq {

auto encode_json(const json& value) -> Result<Bytes> {
  try {
    return to_bytes(value.dump());
  } catch (const json::type_error& e) {
    // Invalid UTF-8 in a string value.
    log::warn("Payload encode failed: {}", e.what());
    return fail(Error::SerializationFailed);
  }
}

auto decode_json(const Bytes& bytes) -> Result<json> {
  auto parsed = json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (parsed.is_discarded()) {
    return fail(Error::SerializationFailed);
  }
  return parsed;
}

auto to_bytes(std::string_view s) -> Bytes {
  return Bytes(s.begin(), s.end());
}

auto to_string(const Bytes& bytes) -> std::string {
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace taskq
