#include "taskq/broker/weighted_scheduler.hpp"

namespace taskq {

WeightedScheduler::WeightedScheduler(std::vector<QueueWeight> queues)
    : queues_(std::move(queues)) {
  credits_.reserve(queues_.size());
  for (const auto& q : queues_) {
    credits_.push_back(q.weight);
  }
}

auto WeightedScheduler::scan(const TakeFn& take, std::size_t& index)
    -> TakeResult {
  for (std::size_t i = 0; i < queues_.size(); ++i) {
    if (credits_[i] <= 0) {
      continue;
    }
    switch (take(i)) {
      case TakeResult::Taken:
        --credits_[i];
        index = i;
        return TakeResult::Taken;
      case TakeResult::Abort:
        return TakeResult::Abort;
      case TakeResult::Empty:
        break;
    }
  }
  return TakeResult::Empty;
}

auto WeightedScheduler::next(const TakeFn& take) -> std::optional<std::size_t> {
  std::lock_guard lock(mu_);
  std::size_t index = 0;
  auto r = scan(take, index);
  if (r == TakeResult::Taken) {
    return index;
  }
  if (r == TakeResult::Abort) {
    return std::nullopt;
  }

  for (std::size_t i = 0; i < queues_.size(); ++i) {
    credits_[i] = queues_[i].weight;
  }
  if (scan(take, index) == TakeResult::Taken) {
    return index;
  }
  return std::nullopt;
}

auto WeightedScheduler::credits() const -> std::vector<int> {
  std::lock_guard lock(mu_);
  return credits_;
}

auto WeightedScheduler::reset() -> void {
  std::lock_guard lock(mu_);
  for (std::size_t i = 0; i < queues_.size(); ++i) {
    credits_[i] = queues_[i].weight;
  }
}

}  // namespace taskq
