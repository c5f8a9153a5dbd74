#include "taskcore/task/job.hpp"

#include "taskcore/core/constants.hpp"

#include <algorithm>

namespace taskcore {

auto IJob::run_async(TaskContext& ctx) -> task<JobResult> {
  co_return run(ctx);
}

auto TaskContext::sleep(std::chrono::milliseconds duration) -> task<bool> {
  if (!on_carrier()) {
    co_return co_await async_sleep(duration, token_);
  }

  // Sliced so a cancelled unit unwinds without waiting out the full sleep.
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!token_.is_cancelled()) {
    auto remaining = deadline - std::chrono::steady_clock::now();
    if (remaining <= std::chrono::steady_clock::duration::zero()) {
      break;
    }
    auto slice = std::min<std::chrono::nanoseconds>(
        remaining, timing::kCooperativeSleepSlice);
    co_await async_sleep(slice, token_);
  }
  co_return !token_.is_cancelled();
}

}  // namespace taskcore
