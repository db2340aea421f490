#pragma once

#include "taskq/core/mpsc_queue.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace taskq::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

namespace detail {

struct LevelStyle {
  std::string_view name;
  std::string_view color;
};

inline constexpr std::array<LevelStyle, 5> kLevelStyles = {{
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info", "\033[32m"},
    {"warn", "\033[33m"},
    {"error", "\033[31m"},
}};

inline constexpr std::string_view kColorReset = "\033[0m";

}  // namespace detail

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  return detail::kLevelStyles[static_cast<std::size_t>(level)].name;
}

// Unknown names read as info.
[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  for (std::size_t i = 0; i < detail::kLevelStyles.size(); ++i) {
    if (detail::kLevelStyles[i].name == name) {
      return static_cast<Level>(i);
    }
  }
  return Level::Info;
}

// One formatted message waiting for the writer thread. The prefix is
// rendered on the writer, not on the calling thread.
struct Record {
  Level level{Level::Info};
  std::chrono::system_clock::time_point time{};
  std::uint32_t thread{0};
  std::string text;
};

// Process-wide asynchronous logger. Callers format the message and push a
// Record onto an MpscRing; a writer thread drains it in batches. When the
// writer is not running, or the ring is full, the caller writes directly.
class Logger {
public:
  Logger() = default;
  ~Logger() {
    stop();
    std::lock_guard lock(out_mu_);
    if (owns_out_) {
      std::fclose(out_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (writer_running_.exchange(true)) {
      return;
    }
    async_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { drain_until_stopped(); });
  }

  auto stop() -> void {
    async_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    if (!writer_running_.exchange(false)) {
      return;
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    min_level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return min_level_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto enabled(Level at) const noexcept -> bool {
    return at >= min_level_.load(std::memory_order_acquire);
  }

  // Appends to `path` from now on, without colors.
  [[nodiscard]] auto set_output_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::lock_guard lock(out_mu_);
    if (owns_out_) {
      std::fclose(out_);
    }
    out_ = f;
    owns_out_ = true;
    colored_ = false;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    Record rec{level, std::chrono::system_clock::now(), current_thread(),
               std::format(fmt, std::forward<Args>(args)...)};
    if (!async_.load(std::memory_order_acquire)) {
      emit(rec);
      return;
    }
    if (!ring_.push(std::move(rec))) {
      emit(rec);
    }
  }

private:
  static constexpr std::size_t kRingCapacity = 8192;
  static constexpr std::size_t kBatch = 64;

  static auto current_thread() -> std::uint32_t {
    thread_local const auto id = static_cast<std::uint32_t>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1'000'000);
    return id;
  }

  auto emit(const Record& rec) -> void {
    auto time = std::chrono::floor<std::chrono::milliseconds>(rec.time);
    std::lock_guard lock(out_mu_);
    line_.clear();
    auto out = std::back_inserter(line_);
    if (colored_) {
      std::format_to(out, "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                     detail::kLevelStyles[static_cast<std::size_t>(rec.level)].color,
                     level_name(rec.level), detail::kColorReset, rec.thread,
                     rec.text);
    } else {
      std::format_to(out, "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                     level_name(rec.level), rec.thread, rec.text);
    }
    std::print(out_, "{}", line_);
  }

  auto flush() -> void {
    std::lock_guard lock(out_mu_);
    std::fflush(out_);
  }

  auto drain_until_stopped() -> void {
    auto write = [this](Record&& rec) { emit(rec); };
    while (writer_running_.load(std::memory_order_acquire)) {
      if (ring_.drain(write, kBatch) == 0) {
        flush();
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    }
    // async_ is already off, so the ring only shrinks from here.
    while (ring_.drain(write, kBatch) > 0) {
    }
    flush();
  }

  std::atomic<Level> min_level_{Level::Info};
  std::atomic<bool> writer_running_{false};
  std::atomic<bool> async_{false};
  MpscRing<Record> ring_{kRingCapacity};
  std::thread writer_;

  std::mutex out_mu_;
  std::FILE* out_{stdout};
  bool owns_out_{false};
  bool colored_{true};
  std::string line_;
};

inline auto logger() -> Logger& {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void {
  logger().start();
}

inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace taskq::log
