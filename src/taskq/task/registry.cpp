#include "taskq/task/registry.hpp"

#include "taskq/util/log.hpp"

#include <algorithm>

namespace taskq {

auto HandlerRegistry::register_handler(std::string_view type, Handler handler)
    -> Result<void> {
  if (frozen()) {
    log::error("Cannot register handler '{}': registry is frozen", type);
    return fail(Error::AlreadyFrozen);
  }
  if (type.empty() || !handler) {
    return fail(Error::InvalidArgument);
  }
  auto [it, inserted] = handlers_.try_emplace(std::string(type), std::move(handler));
  if (!inserted) {
    log::error("Handler for task type '{}' already registered", type);
    return fail(Error::AlreadyExists);
  }
  log::debug("Registered handler for task type '{}'", type);
  return ok();
}

auto HandlerRegistry::freeze() noexcept -> void {
  frozen_.store(true, std::memory_order_release);
}

auto HandlerRegistry::find(std::string_view type) const -> const Handler* {
  auto it = handlers_.find(type);
  return it != handlers_.end() ? &it->second : nullptr;
}

auto HandlerRegistry::types() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto& [type, _] : handlers_) {
    out.push_back(type);
  }
  std::ranges::sort(out);
  return out;
}

}  // namespace taskq
