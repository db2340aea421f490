#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace taskq {

// Library-level failures. Handler outcomes use TaskError instead.
enum class Error : int {
  Success,

  // configuration and input
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotFound,

  // queues and tasks
  QueueUnknown,
  InvalidQueue,
  TaskNotFound,
  SerializationFailed,

  // infrastructure
  BrokerUnavailable,
  StoreUnavailable,
  DatabaseError,

  // lifecycle
  Cancelled,
  Timeout,
  HandlerNotFound,
  AlreadyExists,
  AlreadyFrozen,

  Unknown,
};

[[nodiscard]] constexpr auto error_message(Error e) noexcept
    -> std::string_view {
  switch (e) {
    case Error::Success: return "success";
    case Error::FileNotFound: return "file not found";
    case Error::ParseError: return "parse error";
    case Error::InvalidArgument: return "invalid argument";
    case Error::NotFound: return "not found";
    case Error::QueueUnknown: return "unknown queue";
    case Error::InvalidQueue: return "invalid queue name";
    case Error::TaskNotFound: return "task not found";
    case Error::SerializationFailed: return "serialization failed";
    case Error::BrokerUnavailable: return "broker unavailable";
    case Error::StoreUnavailable: return "idempotency store unavailable";
    case Error::DatabaseError: return "database error";
    case Error::Cancelled: return "cancelled";
    case Error::Timeout: return "timeout";
    case Error::HandlerNotFound: return "no handler registered for task type";
    case Error::AlreadyExists: return "already exists";
    case Error::AlreadyFrozen: return "registry is frozen";
    case Error::Unknown: break;
  }
  return "unknown error";
}

class ErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "taskq";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    if (ev < 0 || ev > std::to_underlying(Error::Unknown)) {
      return "unknown error";
    }
    return std::string{error_message(static_cast<Error>(ev))};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory category;
  return category;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return Result<std::decay_t<T>>{std::in_place, std::forward<T>(value)};
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace taskq

template <>
struct std::is_error_code_enum<taskq::Error> : std::true_type {};

namespace taskq {

// Transparent hashing so string-keyed maps can be searched with string_view.
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace taskq
