#pragma once

#include "taskcore/executor/attempt.hpp"
#include "taskcore/executor/executor.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace taskcore {

// Runs each body on the calling thread, one at a time. A body with a timeout
// runs on a helper thread that is abandoned if the deadline passes first.
class SequentialExecutor final : public IExecutor {
public:
  SequentialExecutor() = default;
  ~SequentialExecutor() override;

  [[nodiscard]] auto type() const noexcept -> ExecutorType override {
    return ExecutorType::Sequential;
  }

  auto start(ExecutionRequest request, CompletionCallback callback)
      -> void override;
  auto cancel(const TaskId& id) -> bool override;
  auto shutdown(bool wait) -> void override;
  [[nodiscard]] auto metrics() const -> ExecutorMetrics override;

private:
  struct Completion {
    std::mutex mu;
    std::condition_variable cv;
    bool finished{false};

    auto signal() -> void {
      {
        std::lock_guard lock(mu);
        finished = true;
      }
      cv.notify_all();
    }
  };

  auto run_with_deadline(const AttemptPtr& attempt) -> void;

  std::mutex run_mu_;

  mutable std::mutex mu_;
  AttemptPtr current_;
  std::shared_ptr<Completion> current_done_;
  bool shutdown_{false};
};

}  // namespace taskcore
