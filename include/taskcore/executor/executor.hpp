#pragma once

#include "taskcore/executor/executor_type.hpp"
#include "taskcore/task/job.hpp"
#include "taskcore/task/task_error.hpp"
#include "taskcore/util/id.hpp"

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

namespace taskcore {

struct ExecutionRequest {
  TaskId id;
  std::shared_ptr<IJob> job;
  std::optional<std::chrono::milliseconds> timeout;
  TaskContext::ProgressSink progress;
};

// Result of one attempt: the job's value, or TaskExecution, TaskTimeout or
// Cancelled.
using ExecutionOutcome = TaskResult<nlohmann::json>;

using CompletionCallback = std::move_only_function<void(ExecutionOutcome)>;

struct ExecutorMetrics {
  ExecutorType type{ExecutorType::Sequential};
  std::size_t active{0};
  std::size_t capacity{0};
  bool idle{true};
  nlohmann::json extra = nlohmann::json::object();
};

auto to_json(nlohmann::json& j, const ExecutorMetrics& m) -> void;

class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual auto type() const noexcept -> ExecutorType = 0;

  // Starts one attempt. `callback` runs exactly once, possibly before start()
  // returns and possibly on another thread.
  virtual auto start(ExecutionRequest request, CompletionCallback callback)
      -> void = 0;

  // Best effort. True only if the unit was interrupted or never started.
  virtual auto cancel(const TaskId& id) -> bool = 0;

  // Stops accepting work. With wait=false in-flight units are cancelled.
  virtual auto shutdown(bool wait) -> void = 0;

  [[nodiscard]] virtual auto metrics() const -> ExecutorMetrics = 0;

  // start() plus a blocking wait on the outcome.
  auto execute(ExecutionRequest request) -> ExecutionOutcome;
};

class Runtime;

[[nodiscard]] auto create_sequential_executor() -> std::unique_ptr<IExecutor>;
[[nodiscard]] auto create_worker_pool_executor(std::size_t workers)
    -> std::unique_ptr<IExecutor>;
[[nodiscard]] auto create_cooperative_executor(std::size_t max_concurrency,
                                               unsigned carrier_threads)
    -> std::unique_ptr<IExecutor>;

[[nodiscard]] auto create_executor(ExecutorType type, std::size_t workers,
                                   std::size_t max_concurrency,
                                   unsigned carrier_threads)
    -> std::unique_ptr<IExecutor>;

// Suspends the awaiting coroutine until the attempt settles.
class ExecutorAwaiter {
public:
  ExecutorAwaiter(IExecutor& executor, ExecutionRequest request)
      : executor_{executor}, request_{std::move(request)} {
  }

  // The completion callback captures `this`.
  ExecutorAwaiter(const ExecutorAwaiter&) = delete;
  ExecutorAwaiter& operator=(const ExecutorAwaiter&) = delete;
  ExecutorAwaiter(ExecutorAwaiter&&) = delete;
  ExecutorAwaiter& operator=(ExecutorAwaiter&&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  // Resumes on the awaiting coroutine's scheduler, or inline on the settling
  // thread when awaited off a runtime.
  auto await_suspend(std::coroutine_handle<> handle) -> void {
    auto* sched = current_scheduler();
    executor_.start(std::move(request_),
                    [this, handle, sched](ExecutionOutcome outcome) {
                      outcome_.emplace(std::move(outcome));
                      if (sched) {
                        sched->schedule(handle);
                      } else {
                        handle.resume();
                      }
                    });
  }

  [[nodiscard]] auto await_resume() -> ExecutionOutcome {
    return std::move(*outcome_);
  }

private:
  IExecutor& executor_;
  ExecutionRequest request_;
  std::optional<ExecutionOutcome> outcome_;
};

[[nodiscard]] inline auto execute_async(IExecutor& executor,
                                        ExecutionRequest request)
    -> ExecutorAwaiter {
  return ExecutorAwaiter{executor, std::move(request)};
}

}  // namespace taskcore
