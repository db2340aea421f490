#include "taskq/util/signals.hpp"

#include "taskq/util/log.hpp"

#include <chrono>
#include <csignal>
#include <cstring>

#include <pthread.h>

namespace taskq {

namespace {

auto shutdown_set() -> sigset_t {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

}  // namespace

ShutdownSignals::ShutdownSignals() {
  auto set = shutdown_set();
  if (int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr); rc != 0) {
    log::warn("Failed to block shutdown signals: {}", std::strerror(rc));
  }

  waiter_ = std::thread([this, set] {
    int sig = 0;
    while (sigwait(&set, &sig) == 0) {
      if (sig == SIGINT || sig == SIGTERM) {
        break;
      }
    }
    received_.store(sig, std::memory_order_release);
    source_.cancel(CancelReason::Shutdown);
  });
}

ShutdownSignals::~ShutdownSignals() {
  if (waiter_.joinable()) {
    if (!source_.is_cancelled()) {
      // Wake sigwait with a signal it is waiting for; it is blocked process
      // wide, so only the waiter sees it.
      pthread_kill(waiter_.native_handle(), SIGTERM);
    }
    waiter_.join();
  }
}

auto ShutdownSignals::wait() const -> void {
  auto token = source_.token();
  while (!token.wait_for(std::chrono::seconds(1))) {
  }
  log::info("Shutdown requested by signal {} ({})", received(),
            strsignal(received()));
}

}  // namespace taskq
