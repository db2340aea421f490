#pragma once

#include "taskq/util/cancellation.hpp"

#include <atomic>
#include <thread>

namespace taskq {

// Routes SIGINT and SIGTERM to a cancellation token. The signals are blocked
// in the constructing thread, and in every thread it starts afterwards, and
// are collected with sigwait() on a dedicated thread, so construct this before
// starting workers.
class ShutdownSignals {
public:
  ShutdownSignals();
  ~ShutdownSignals();

  ShutdownSignals(const ShutdownSignals&) = delete;
  ShutdownSignals& operator=(const ShutdownSignals&) = delete;

  [[nodiscard]] auto token() const noexcept -> CancellationToken {
    return source_.token();
  }
  // Signal number that triggered shutdown, 0 while none has arrived.
  [[nodiscard]] auto received() const noexcept -> int {
    return received_.load(std::memory_order_acquire);
  }

  auto wait() const -> void;

private:
  CancellationSource source_;
  std::atomic<int> received_{0};
  std::thread waiter_;
};

}  // namespace taskq
