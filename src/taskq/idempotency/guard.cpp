#include "taskq/idempotency/guard.hpp"

#include "taskq/util/log.hpp"

#include <nlohmann/json.hpp>

namespace taskq {

namespace {

using json = nlohmann::json;

constexpr std::string_view kInProgress = "in_progress";
constexpr std::string_view kCompleted = "completed";

// Records are small msgpack maps: {"status": ..., "result": <binary>}.
auto encode_record(std::string_view status, const std::optional<Bytes>& result)
    -> Bytes {
  json j = {{"status", std::string(status)}};
  if (result) {
    j["result"] = json::binary(*result);
  }
  return json::to_msgpack(j);
}

struct Record {
  std::string status;
  std::optional<Bytes> result;
};

auto decode_record(const Bytes& bytes) -> std::optional<Record> {
  auto j = json::from_msgpack(bytes, true, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  Record r;
  r.status = j.value("status", "");
  if (auto it = j.find("result"); it != j.end() && it->is_binary()) {
    const auto& bin = it->get_binary();
    r.result = Bytes(bin.begin(), bin.end());
  }
  return r;
}

auto in_progress_record() -> const Bytes& {
  static const Bytes record = encode_record(kInProgress, std::nullopt);
  return record;
}

}  // namespace

IdempotencyGuard::IdempotencyGuard(KeyValueStore& store, std::string key_prefix,
                                   FailMode mode)
    : store_(store), prefix_(std::move(key_prefix)), mode_(mode) {
}

auto IdempotencyGuard::full_key(std::string_view key) const -> std::string {
  return prefix_ + std::string(key);
}

auto IdempotencyGuard::reserve(std::string_view key,
                               std::chrono::milliseconds ttl)
    -> Result<Reservation> {
  return reserve(key, ttl, mode_);
}

auto IdempotencyGuard::reserve(std::string_view key,
                               std::chrono::milliseconds ttl, FailMode mode)
    -> Result<Reservation> {
  if (key.empty()) {
    return Reservation{};
  }

  auto fk = full_key(key);
  auto unavailable = [&](const std::error_code& ec) -> Result<Reservation> {
    if (mode == FailMode::Open) {
      log::warn("Idempotency check failed, processing anyway: key={} error={}",
                key, ec.message());
      return Reservation{};
    }
    log::error("Idempotency check failed: key={} error={}", key, ec.message());
    return fail(Error::StoreUnavailable);
  };

  auto created = store_.set_if_absent(fk, in_progress_record(), ttl);
  if (!created) {
    return unavailable(created.error());
  }
  if (*created) {
    return Reservation{.reserved = true};
  }

  Reservation res{.already_handled = true};
  auto existing = store_.get(fk);
  if (!existing) {
    return unavailable(existing.error());
  }
  if (*existing) {
    if (auto rec = decode_record(**existing); rec && rec->status == kCompleted) {
      res.cached_result = std::move(rec->result);
    }
  }
  log::debug("Duplicate task detected: key={}", key);
  return res;
}

auto IdempotencyGuard::release(std::string_view key,
                               const std::optional<Bytes>& result,
                               std::chrono::milliseconds ttl) -> Result<void> {
  if (key.empty()) {
    return ok();
  }
  if (auto r = store_.set(full_key(key), encode_record(kCompleted, result), ttl);
      !r) {
    log::warn("Failed to store idempotency result: key={} error={}", key,
              r.error().message());
    return fail(Error::StoreUnavailable);
  }
  return ok();
}

auto IdempotencyGuard::abandon(std::string_view key) -> Result<void> {
  if (key.empty()) {
    return ok();
  }
  auto r = store_.erase_if(full_key(key), in_progress_record());
  if (!r) {
    return fail(Error::StoreUnavailable);
  }
  return ok();
}

auto make_idempotent(Handler handler, IdempotencyGuard& guard,
                     IdempotentOptions options) -> Handler {
  return [handler = std::move(handler), &guard,
          options = std::move(options)](TaskContext& ctx,
                                        const Task& task) -> HandlerResult {
    auto key = options.key_extractor ? options.key_extractor(task)
                                     : task.id.str();
    if (key.empty()) {
      return handler(ctx, task);
    }

    auto mode = options.fail_mode.value_or(guard.mode());
    auto res = guard.reserve(key, options.ttl, mode);
    if (!res) {
      return std::unexpected(TaskError::store_unavailable(
          "idempotency store unavailable: " + res.error().message()));
    }
    if (res->already_handled) {
      log::debug("Duplicate task skipped: task_id={} task_type={} key={}",
                 task.id, task.type, key);
      if (res->cached_result) {
        ctx.set_result(std::move(*res->cached_result));
      }
      return {};
    }

    if (!res->reserved) {
      return handler(ctx, task);
    }

    HandlerResult result;
    try {
      result = handler(ctx, task);
    } catch (...) {
      // Recovery further out turns this into a retryable panic; the retry
      // must not find the key still held.
      if (auto r = guard.abandon(key); !r) {
        log::warn("Failed to abandon idempotency key {}: {}", key,
                  r.error().message());
      }
      throw;
    }
    if (result) {
      if (auto r = guard.release(key, ctx.result(), options.ttl); !r) {
        log::warn("Task {} succeeded but its idempotency record was not "
                  "stored", task.id);
      }
    } else if (auto r = guard.abandon(key); !r) {
      log::warn("Failed to abandon idempotency key {}: {}", key,
                r.error().message());
    }
    return result;
  };
}

}  // namespace taskq
