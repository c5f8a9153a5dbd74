#pragma once

#include "taskcore/core/coroutine.hpp"
#include "taskcore/core/runtime.hpp"
#include "taskcore/executor/async_semaphore.hpp"
#include "taskcore/executor/attempt.hpp"
#include "taskcore/executor/deadline_timer.hpp"
#include "taskcore/executor/executor.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace taskcore {

// Coroutine units on a small carrier runtime, at most `max_concurrency`
// holding a permit at once. Units suspend only at TaskContext::sleep and
// TaskContext::checkpoint, which is also where they observe cancellation.
class CooperativeExecutor final : public IExecutor {
public:
  CooperativeExecutor(std::size_t max_concurrency, unsigned carrier_threads);
  ~CooperativeExecutor() override;

  [[nodiscard]] auto type() const noexcept -> ExecutorType override {
    return ExecutorType::Async;
  }

  auto start(ExecutionRequest request, CompletionCallback callback)
      -> void override;
  auto cancel(const TaskId& id) -> bool override;
  auto shutdown(bool wait) -> void override;
  [[nodiscard]] auto metrics() const -> ExecutorMetrics override;

  [[nodiscard]] auto runtime() noexcept -> Runtime& {
    return runtime_;
  }

private:
  struct Unit {
    AttemptPtr attempt;
    bool running{false};
    std::optional<DeadlineTimer::TimerId> timer;
  };

  static auto run_unit(CooperativeExecutor& self, std::uint64_t seq,
                       AttemptPtr attempt) -> detached_task;
  static auto run_body(AttemptPtr attempt) -> task<ExecutionOutcome>;

  auto mark_running(std::uint64_t seq) -> void;
  auto finish_unit(std::uint64_t seq) -> void;

  std::size_t max_concurrency_;
  Runtime runtime_;
  AsyncSemaphore semaphore_;
  DeadlineTimer timer_;

  mutable std::mutex mu_;
  std::condition_variable drained_cv_;
  std::unordered_map<std::uint64_t, Unit> units_;
  std::uint64_t next_unit_{0};
  std::size_t running_{0};
  bool stopping_{false};
  bool stopped_{false};
};

}  // namespace taskcore
