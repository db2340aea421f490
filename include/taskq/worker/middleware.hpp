#pragma once

#include "taskq/task/context.hpp"
#include "taskq/worker/metrics.hpp"

#include <functional>
#include <vector>

namespace taskq {

using Middleware = std::function<Handler(Handler)>;

// The first middleware is the outermost wrapper.
[[nodiscard]] auto chain(Handler handler, const std::vector<Middleware>& mws)
    -> Handler;

// Turns an exception escaping `next` into a Panic error and logs it with a
// backtrace. The panic is terminal (skip-retry) when configured.
[[nodiscard]] auto recovery_middleware(bool panic_is_terminal = false)
    -> Middleware;

// Assigns trace and span ids to the context and logs the span outcome.
[[nodiscard]] auto tracing_middleware() -> Middleware;

[[nodiscard]] auto metrics_middleware(Metrics& metrics) -> Middleware;

[[nodiscard]] auto logging_middleware() -> Middleware;

// Innermost. Rewrites the handler's outcome to what the pool will route: a
// return past the deadline becomes Timeout, a non-transient error after a
// shutdown cancel becomes Transient. Placed inside metrics and logging so
// they record the same outcome.
[[nodiscard]] auto deadline_middleware() -> Middleware;

// recovery -> tracing -> metrics -> logging
[[nodiscard]] auto default_middleware(bool panic_is_terminal, Metrics* metrics)
    -> std::vector<Middleware>;

}  // namespace taskq
