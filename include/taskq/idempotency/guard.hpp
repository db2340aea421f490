#pragma once

#include "taskq/broker/store.hpp"
#include "taskq/config/system_config.hpp"
#include "taskq/core/error.hpp"
#include "taskq/task/context.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace taskq {

struct Reservation {
  // Another attempt holds or has completed the key; the handler must not run.
  bool already_handled{false};
  std::optional<Bytes> cached_result;
  // True when this call created the InProgress record and owns it.
  bool reserved{false};
};

// At-most-once gate over a KeyValueStore. A key moves through
// absent -> InProgress -> Completed; set-if-absent makes the first
// transition atomic, so concurrent reservations have a single winner.
class IdempotencyGuard {
public:
  IdempotencyGuard(KeyValueStore& store, std::string key_prefix,
                   FailMode mode = FailMode::Open);

  // Empty key: no idempotency, proceed. Store failure: proceed in fail-open
  // mode, StoreUnavailable in fail-closed mode.
  [[nodiscard]] auto reserve(std::string_view key,
                             std::chrono::milliseconds ttl)
      -> Result<Reservation>;
  [[nodiscard]] auto reserve(std::string_view key,
                             std::chrono::milliseconds ttl, FailMode mode)
      -> Result<Reservation>;

  // Marks the key Completed and stores the optional result.
  [[nodiscard]] auto release(std::string_view key,
                             const std::optional<Bytes>& result,
                             std::chrono::milliseconds ttl) -> Result<void>;

  // Drops an InProgress record so a retry of the same task can proceed.
  // Completed records are left alone.
  [[nodiscard]] auto abandon(std::string_view key) -> Result<void>;

  [[nodiscard]] auto mode() const noexcept -> FailMode {
    return mode_;
  }
  [[nodiscard]] auto full_key(std::string_view key) const -> std::string;

private:
  KeyValueStore& store_;
  std::string prefix_;
  FailMode mode_;
};

using KeyExtractor = std::function<std::string(const Task&)>;

struct IdempotentOptions {
  std::chrono::milliseconds ttl{86'400'000};
  // Defaults to the task id.
  KeyExtractor key_extractor;
  // Defaults to the guard's mode.
  std::optional<FailMode> fail_mode;
};

// Wraps `handler` so duplicates of an already started or completed key
// succeed without running it. A cached result is copied into the context.
[[nodiscard]] auto make_idempotent(Handler handler, IdempotencyGuard& guard,
                                   IdempotentOptions options = {}) -> Handler;

}  // namespace taskq
