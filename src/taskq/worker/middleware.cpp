#include "taskq/worker/middleware.hpp"

#include "taskq/task/state_strings.hpp"
#include "taskq/util/backtrace.hpp"
#include "taskq/util/id.hpp"
#include "taskq/util/log.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <ranges>

namespace taskq {

namespace {

// `thrown_at` is empty unless the exception carried its own frames; the
// fallback is this frame's stack, which no longer contains the throw site.
auto recovered(const Task& task, std::string_view what, bool terminal,
               const std::vector<std::string>& thrown_at = {})
    -> HandlerResult {
  if (!thrown_at.empty()) {
    log::error("panic in task task_id={} task_type={} panic=\"{}\" "
               "stack at throw site:\n{}",
               task.id, task.type, what, format_backtrace(thrown_at));
  } else {
    log::error("panic in task task_id={} task_type={} panic=\"{}\" "
               "stack at recovery (throw site not captured):\n{}",
               task.id, task.type, what, format_backtrace(backtrace_frames(2)));
  }
  return std::unexpected(
      TaskError::panic(std::format("panic recovered: {}", what), terminal));
}

}  // namespace

auto chain(Handler handler, const std::vector<Middleware>& mws) -> Handler {
  for (const auto& mw : mws | std::views::reverse) {
    handler = mw(std::move(handler));
  }
  return handler;
}

auto recovery_middleware(bool panic_is_terminal) -> Middleware {
  return [panic_is_terminal](Handler next) -> Handler {
    return [next = std::move(next), panic_is_terminal](
               TaskContext& ctx, const Task& task) -> HandlerResult {
      try {
        return next(ctx, task);
      } catch (const TracedError& e) {
        return recovered(task, e.what(), panic_is_terminal, e.frames());
      } catch (const std::exception& e) {
        return recovered(task, e.what(), panic_is_terminal);
      } catch (...) {
        return recovered(task, "unknown exception", panic_is_terminal);
      }
    };
  };
}

auto tracing_middleware() -> Middleware {
  return [](Handler next) -> Handler {
    return [next = std::move(next)](TaskContext& ctx,
                                    const Task& task) -> HandlerResult {
      ctx.set_trace(ids::trace_id(), ids::span_id());
      log::trace("span start name=task:{} trace_id={} span_id={} task_id={}",
                 task.type, ctx.trace_id(), ctx.span_id(), task.id);
      auto result = next(ctx, task);
      if (result) {
        log::trace("span end trace_id={} span_id={} status=ok", ctx.trace_id(),
                   ctx.span_id());
      } else {
        log::trace("span end trace_id={} span_id={} status=error error=\"{}\"",
                   ctx.trace_id(), ctx.span_id(), result.error().message);
      }
      return result;
    };
  };
}

auto metrics_middleware(Metrics& metrics) -> Middleware {
  return [&metrics](Handler next) -> Handler {
    return [next = std::move(next), &metrics](TaskContext& ctx,
                                              const Task& task) -> HandlerResult {
      auto start = std::chrono::steady_clock::now();
      auto result = next(ctx, task);
      std::chrono::duration<double> elapsed =
          std::chrono::steady_clock::now() - start;
      metrics.record_processed(task.type, task.queue, result.has_value());
      metrics.observe_duration(task.type, task.queue, elapsed.count());
      return result;
    };
  };
}

auto logging_middleware() -> Middleware {
  return [](Handler next) -> Handler {
    return [next = std::move(next)](TaskContext& ctx,
                                    const Task& task) -> HandlerResult {
      auto start = std::chrono::steady_clock::now();
      auto result = next(ctx, task);
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start)
                    .count();
      if (result) {
        log::info("task processed task_id={} task_type={} queue={} "
                  "retry_count={} duration_ms={}",
                  task.id, task.type, task.queue, task.retry_count, ms);
      } else {
        log::error("task failed task_id={} task_type={} queue={} "
                   "retry_count={} duration_ms={} kind={} error=\"{}\"",
                   task.id, task.type, task.queue, task.retry_count, ms,
                   failure_kind_name(result.error().kind),
                   result.error().message);
      }
      return result;
    };
  };
}

auto deadline_middleware() -> Middleware {
  return [](Handler next) -> Handler {
    return [next = std::move(next)](TaskContext& ctx,
                                    const Task& task) -> HandlerResult {
      auto result = next(ctx, task);
      auto reason = ctx.token().reason();
      if (reason == CancelReason::Deadline || ctx.deadline_exceeded()) {
        auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(
            ctx.deadline() - ctx.started_at());
        return std::unexpected(TaskError::timeout(std::format(
            "processing deadline of {}ms exceeded", budget.count())));
      }
      if (!result && reason == CancelReason::Shutdown &&
          result.error().kind != FailureKind::Transient) {
        return std::unexpected(TaskError::transient(
            "cancelled by worker shutdown: " + result.error().message));
      }
      return result;
    };
  };
}

auto default_middleware(bool panic_is_terminal, Metrics* metrics)
    -> std::vector<Middleware> {
  std::vector<Middleware> mws;
  mws.push_back(recovery_middleware(panic_is_terminal));
  mws.push_back(tracing_middleware());
  if (metrics) {
    mws.push_back(metrics_middleware(*metrics));
  }
  mws.push_back(logging_middleware());
  return mws;
}

}  // namespace taskq
