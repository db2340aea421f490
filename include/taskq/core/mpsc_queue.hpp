#pragma once

#include <atomic>
#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>

namespace taskq {

inline constexpr std::size_t kCacheLineSize =
#ifdef __cpp_lib_hardware_interference_size
    std::hardware_destructive_interference_size;
#else
    64;
#endif

template <typename T>
concept RingElement = std::movable<T> && std::default_initializable<T>;

// Fixed-capacity ring for many producers and one consumer. Each cell carries
// a turn counter: producers claim a position with a CAS on the write cursor
// and publish by bumping the cell's turn; the consumer owns the read cursor.
// push() reports a full ring instead of waiting.
template <RingElement T>
class MpscRing {
public:
  explicit MpscRing(std::size_t min_capacity)
      : cells_(std::bit_ceil(std::max<std::size_t>(min_capacity, 2))),
        ring_(std::make_unique<Cell[]>(cells_)) {
    for (std::size_t i = 0; i < cells_; ++i) {
      ring_[i].turn.store(i, std::memory_order_relaxed);
    }
  }

  MpscRing(const MpscRing&) = delete;
  MpscRing& operator=(const MpscRing&) = delete;

  // `item` is left untouched when the ring is full.
  [[nodiscard]] auto push(T&& item) -> bool {
    std::size_t at = write_.load(std::memory_order_relaxed);
    while (true) {
      Cell& cell = ring_[at & (cells_ - 1)];
      const std::size_t turn = cell.turn.load(std::memory_order_acquire);
      if (turn == at) {
        if (write_.compare_exchange_weak(at, at + 1,
                                         std::memory_order_relaxed)) {
          cell.item = std::move(item);
          cell.turn.store(at + 1, std::memory_order_release);
          return true;
        }
      } else if (turn < at) {
        // The consumer has not freed this cell yet.
        return false;
      } else {
        at = write_.load(std::memory_order_relaxed);
      }
    }
  }

  [[nodiscard]] auto push(const T& item) -> bool
    requires std::copyable<T>
  {
    T copy(item);
    return push(std::move(copy));
  }

  // Consumer side.
  [[nodiscard]] auto try_pop() -> std::optional<T> {
    const std::size_t at = read_.load(std::memory_order_relaxed);
    Cell& cell = ring_[at & (cells_ - 1)];
    if (cell.turn.load(std::memory_order_acquire) != at + 1) {
      return std::nullopt;
    }
    std::optional<T> out{std::move(cell.item)};
    cell.item = T{};
    cell.turn.store(at + cells_, std::memory_order_release);
    read_.store(at + 1, std::memory_order_relaxed);
    return out;
  }

  // Consumer side. Hands up to `max` items to `sink` in FIFO order and returns
  // how many were taken.
  template <typename Sink>
    requires std::invocable<Sink&, T&&>
  auto drain(Sink&& sink, std::size_t max) -> std::size_t {
    std::size_t taken = 0;
    while (taken < max) {
      auto item = try_pop();
      if (!item) {
        break;
      }
      sink(std::move(*item));
      ++taken;
    }
    return taken;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return write_.load(std::memory_order_acquire) ==
           read_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return cells_;
  }

private:
  struct Cell {
    std::atomic<std::size_t> turn{0};
    T item{};
  };

  std::size_t cells_;
  std::unique_ptr<Cell[]> ring_;
  alignas(kCacheLineSize) std::atomic<std::size_t> write_{0};
  alignas(kCacheLineSize) std::atomic<std::size_t> read_{0};
};

}  // namespace taskq
