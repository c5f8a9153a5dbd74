#pragma once

#include "taskcore/core/cancellation.hpp"
#include "taskcore/executor/executor.hpp"
#include "taskcore/task/job.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace taskcore {

// Shared state of one in-flight attempt. Body completion, the deadline timer
// and cancel() race to settle it; the first one wins.
class Attempt {
public:
  Attempt(ExecutionRequest request, CompletionCallback callback)
      : request_(std::move(request)), callback_(std::move(callback)) {
  }

  Attempt(const Attempt&) = delete;
  Attempt& operator=(const Attempt&) = delete;

  [[nodiscard]] auto id() const noexcept -> const TaskId& {
    return request_.id;
  }
  [[nodiscard]] auto request() const noexcept -> const ExecutionRequest& {
    return request_;
  }
  [[nodiscard]] auto token() const noexcept -> CancellationToken {
    return source_.token();
  }
  [[nodiscard]] auto context() -> TaskContext {
    return TaskContext{request_.id, source_.token(), request_.progress};
  }

  auto request_cancel() noexcept -> void {
    source_.cancel();
  }

  [[nodiscard]] auto settled() const noexcept -> bool {
    return settled_.load(std::memory_order_acquire);
  }

  // Returns false if another outcome got there first.
  auto settle(ExecutionOutcome outcome) -> bool;

private:
  ExecutionRequest request_;
  CancellationSource source_;
  CompletionCallback callback_;
  std::atomic<bool> settled_{false};
};

using AttemptPtr = std::shared_ptr<Attempt>;

// Runs the synchronous body and maps its return or exception to an outcome.
[[nodiscard]] auto invoke_job(IJob& job, TaskContext& ctx) -> ExecutionOutcome;

// Maps a finished body's result to an outcome, honouring cancellation.
[[nodiscard]] auto to_outcome(const TaskContext& ctx, JobResult result)
    -> ExecutionOutcome;

}  // namespace taskcore
