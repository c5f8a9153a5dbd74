#include "taskcore/executor/attempt.hpp"

#include "taskcore/util/log.hpp"

#include <exception>
#include <format>
#include <typeinfo>

namespace taskcore {

auto Attempt::settle(ExecutionOutcome outcome) -> bool {
  if (settled_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  auto callback = std::move(callback_);
  if (callback) {
    callback(std::move(outcome));
  }
  return true;
}

auto to_outcome(const TaskContext& ctx, JobResult result) -> ExecutionOutcome {
  if (ctx.is_cancelled()) {
    return std::unexpected{task_errors::cancelled(ctx.id(), "cancelled")};
  }
  if (!result) {
    return std::unexpected{task_errors::execution(
        ctx.id(),
        std::format("Task {} failed: {}", ctx.id(), result.error().message),
        std::move(result.error()))};
  }
  return std::move(*result);
}

auto invoke_job(IJob& job, TaskContext& ctx) -> ExecutionOutcome {
  try {
    return to_outcome(ctx, job.run(ctx));
  } catch (const std::exception& e) {
    log::debug("Task {} threw: {}", ctx.id(), e.what());
    return std::unexpected{task_errors::execution(
        ctx.id(), std::format("Task {} failed: {}", ctx.id(), e.what()),
        ErrorCause{typeid(e).name(), e.what()})};
  } catch (...) {
    return std::unexpected{task_errors::execution(
        ctx.id(), std::format("Task {} failed: unknown exception", ctx.id()),
        ErrorCause{"unknown", "non-standard exception"})};
  }
}

}  // namespace taskcore
