#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace taskq {

enum class CancelReason : std::uint8_t {
  None,
  Shutdown,
  Deadline,
};

class CancellationToken;

class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  // First reason wins; later calls are no-ops.
  auto cancel(CancelReason reason = CancelReason::Shutdown) noexcept -> void {
    {
      std::lock_guard lock(state_->mu);
      auto expected = CancelReason::None;
      if (!state_->reason.compare_exchange_strong(expected, reason,
                                                  std::memory_order_acq_rel)) {
        return;
      }
    }
    state_->cv.notify_all();
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->reason.load(std::memory_order_acquire) != CancelReason::None;
  }

  [[nodiscard]] auto reason() const noexcept -> CancelReason {
    return state_->reason.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<CancelReason> reason{CancelReason::None};
    std::mutex mu;
    std::condition_variable cv;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ &&
           state_->reason.load(std::memory_order_acquire) != CancelReason::None;
  }

  [[nodiscard]] auto reason() const noexcept -> CancelReason {
    return state_ ? state_->reason.load(std::memory_order_acquire)
                  : CancelReason::None;
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  // Sleeps up to `timeout`; returns true as soon as the token is cancelled.
  template <typename Rep, typename Period>
  auto wait_for(std::chrono::duration<Rep, Period> timeout) const -> bool {
    if (!state_) {
      std::this_thread::sleep_for(timeout);
      return false;
    }
    std::unique_lock lock(state_->mu);
    return state_->cv.wait_for(lock, timeout, [this] {
      return state_->reason.load(std::memory_order_acquire) !=
             CancelReason::None;
    });
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace taskq
