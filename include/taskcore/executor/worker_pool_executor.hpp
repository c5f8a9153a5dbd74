#pragma once

#include "taskcore/executor/attempt.hpp"
#include "taskcore/executor/deadline_timer.hpp"
#include "taskcore/executor/executor.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace taskcore {

// Fixed set of OS threads pulling attempts from a FIFO queue. Only queued
// attempts can be cancelled; a running body is never interrupted.
class WorkerPoolExecutor final : public IExecutor {
public:
  explicit WorkerPoolExecutor(std::size_t workers = 0);
  ~WorkerPoolExecutor() override;

  [[nodiscard]] auto type() const noexcept -> ExecutorType override {
    return ExecutorType::ThreadPool;
  }

  auto start(ExecutionRequest request, CompletionCallback callback)
      -> void override;
  auto cancel(const TaskId& id) -> bool override;
  auto shutdown(bool wait) -> void override;
  [[nodiscard]] auto metrics() const -> ExecutorMetrics override;

  [[nodiscard]] auto worker_count() const noexcept -> std::size_t {
    return worker_count_;
  }

private:
  enum class UnitState : std::uint8_t { Queued, Running };

  struct Unit {
    AttemptPtr attempt;
    UnitState state{UnitState::Queued};
    std::optional<DeadlineTimer::TimerId> timer;
  };

  auto worker_loop() -> void;

  std::size_t worker_count_;
  std::vector<std::thread> workers_;
  DeadlineTimer timer_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  // Keyed by unit sequence: a timed-out body may still be running when the
  // retry of the same task is queued.
  std::deque<std::uint64_t> queue_;
  std::unordered_map<std::uint64_t, Unit> units_;
  std::uint64_t next_unit_{0};
  std::size_t running_{0};
  bool stopping_{false};
};

}  // namespace taskcore
