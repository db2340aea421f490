#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace taskq {

// Opaque task identifier, kept distinct from queue names and task types.
class TaskId {
public:
  TaskId() = default;
  explicit TaskId(std::string text) : text_(std::move(text)) {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return text_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string& {
    return text_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return text_.empty(); }

  auto operator<=>(const TaskId&) const = default;
  auto operator==(const TaskId&) const -> bool = default;

  friend auto operator<<(std::ostream& os, const TaskId& id) -> std::ostream& {
    return os << id.text_;
  }

private:
  std::string text_;
};

namespace ids {

inline auto random_word() -> std::uint64_t {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine();
}

// Appends the low `digits` nibbles of `bits`, most significant first.
inline void append_hex(std::string& out, std::uint64_t bits, int digits) {
  constexpr std::string_view kHex = "0123456789abcdef";
  for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
    out.push_back(kHex[(bits >> shift) & 0xF]);
  }
}

// Random RFC 4122 version 4 UUID, lower-case text form.
inline auto uuid_v4() -> std::string {
  std::uint64_t hi = (random_word() & ~0xF000ULL) | 0x4000ULL;
  std::uint64_t lo = (random_word() & ~(3ULL << 62)) | (1ULL << 63);

  std::string out;
  out.reserve(36);
  append_hex(out, hi >> 32, 8);
  out.push_back('-');
  append_hex(out, hi >> 16, 4);
  out.push_back('-');
  append_hex(out, hi, 4);
  out.push_back('-');
  append_hex(out, lo >> 48, 4);
  out.push_back('-');
  append_hex(out, lo, 12);
  return out;
}

// W3C trace-context sizes: 16-byte trace id, 8-byte span id, as hex.
inline auto trace_id() -> std::string {
  std::string out;
  out.reserve(32);
  append_hex(out, random_word(), 16);
  append_hex(out, random_word(), 16);
  return out;
}

inline auto span_id() -> std::string {
  std::string out;
  out.reserve(16);
  append_hex(out, random_word(), 16);
  return out;
}

}  // namespace ids

inline auto new_task_id() -> TaskId { return TaskId{ids::uuid_v4()}; }

}  // namespace taskq

template <>
struct std::hash<taskq::TaskId> {
  auto operator()(const taskq::TaskId& id) const noexcept -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <>
struct std::formatter<taskq::TaskId> : std::formatter<std::string_view> {
  auto format(const taskq::TaskId& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
