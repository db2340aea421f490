#pragma once

#include "taskq/core/error.hpp"
#include "taskq/task/context.hpp"

#include <atomic>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskq {

// task type -> handler. Populated at startup, then frozen; lookups after
// freeze() take no lock.
class HandlerRegistry {
public:
  [[nodiscard]] auto register_handler(std::string_view type, Handler handler)
      -> Result<void>;
  auto freeze() noexcept -> void;
  [[nodiscard]] auto frozen() const noexcept -> bool {
    return frozen_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto find(std::string_view type) const -> const Handler*;
  [[nodiscard]] auto contains(std::string_view type) const -> bool {
    return find(type) != nullptr;
  }
  [[nodiscard]] auto types() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return handlers_.size();
  }

private:
  std::unordered_map<std::string, Handler, StringHash, StringEqual> handlers_;
  std::atomic<bool> frozen_{false};
};

}  // namespace taskq
