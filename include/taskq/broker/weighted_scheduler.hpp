#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskq {

struct QueueWeight {
  std::string name;
  int weight{1};
};

// Credit-based weighted round-robin over an ordered list of queues.
//
// Each queue starts with credit equal to its weight. A scan visits queues in
// configured order and dispatches from the first one that has credit and a
// ready task, consuming one credit. When no queue with credit yields a task,
// every credit is reset to its weight and the scan runs once more. A queue
// of weight w therefore receives w dispatches per full cycle while it has
// work, and every non-empty queue is served within one cycle.
class WeightedScheduler {
public:
  enum class TakeResult { Taken, Empty, Abort };

  // Attempts to take a task from queue `index`.
  using TakeFn = std::function<TakeResult(std::size_t index)>;

  explicit WeightedScheduler(std::vector<QueueWeight> queues);

  // Returns the index of the queue dispatched from, or nullopt when all
  // queues were empty or `take` aborted.
  [[nodiscard]] auto next(const TakeFn& take) -> std::optional<std::size_t>;

  [[nodiscard]] auto queues() const noexcept -> const std::vector<QueueWeight>& {
    return queues_;
  }
  [[nodiscard]] auto credits() const -> std::vector<int>;
  auto reset() -> void;

private:
  // Returns Taken/Abort with the index, or Empty after a full pass.
  [[nodiscard]] auto scan(const TakeFn& take, std::size_t& index) -> TakeResult;

  std::vector<QueueWeight> queues_;
  std::vector<int> credits_;
  mutable std::mutex mu_;
};

}  // namespace taskq
