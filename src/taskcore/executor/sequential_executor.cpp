#include "taskcore/executor/sequential_executor.hpp"

#include "taskcore/core/constants.hpp"
#include "taskcore/util/log.hpp"

#include <algorithm>
#include <thread>

namespace taskcore {

SequentialExecutor::~SequentialExecutor() {
  shutdown(false);
}

auto SequentialExecutor::start(ExecutionRequest request,
                               CompletionCallback callback) -> void {
  auto attempt =
      std::make_shared<Attempt>(std::move(request), std::move(callback));

  std::lock_guard run_lock(run_mu_);
  {
    std::lock_guard lock(mu_);
    if (shutdown_) {
      attempt->settle(std::unexpected{
          task_errors::execution(attempt->id(), "Executor is shut down")});
      return;
    }
    current_ = attempt;
  }

  log::debug("Sequential executor running task {}", attempt->id());
  if (attempt->request().timeout) {
    run_with_deadline(attempt);
  } else {
    auto ctx = attempt->context();
    attempt->settle(invoke_job(*attempt->request().job, ctx));
  }

  std::lock_guard lock(mu_);
  current_.reset();
  current_done_.reset();
}

auto SequentialExecutor::run_with_deadline(const AttemptPtr& attempt)
    -> void {
  auto done = std::make_shared<Completion>();
  {
    std::lock_guard lock(mu_);
    current_done_ = done;
  }

  std::thread([attempt, done] {
    auto ctx = attempt->context();
    attempt->settle(invoke_job(*attempt->request().job, ctx));
    done->signal();
  }).detach();

  auto limit = std::min<std::chrono::milliseconds>(*attempt->request().timeout,
                                                   timing::kMaxTaskTimeout);
  std::unique_lock lock(done->mu);
  auto finished = done->cv.wait_for(lock, limit, [&] {
    return done->finished || attempt->settled();
  });
  lock.unlock();

  if (!finished) {
    attempt->request_cancel();
    if (attempt->settle(
            std::unexpected{task_errors::timeout(attempt->id(), limit)})) {
      log::warn("Task {} timed out after {}, body abandoned", attempt->id(),
                limit);
    }
  }
}

auto SequentialExecutor::cancel(const TaskId& id) -> bool {
  AttemptPtr attempt;
  std::shared_ptr<Completion> done;
  {
    std::lock_guard lock(mu_);
    if (!current_ || current_->id() != id) {
      return false;
    }
    attempt = current_;
    done = current_done_;
  }

  attempt->request_cancel();
  auto cancelled = attempt->settle(
      std::unexpected{task_errors::cancelled(id, "cancelled by user")});
  if (done) {
    // Wake the deadline wait; the abandoned body keeps running detached.
    std::lock_guard lock(done->mu);
    done->cv.notify_all();
  }
  return cancelled;
}

auto SequentialExecutor::shutdown(bool wait) -> void {
  AttemptPtr attempt;
  {
    std::lock_guard lock(mu_);
    shutdown_ = true;
    attempt = current_;
  }
  if (!wait && attempt) {
    (void)cancel(attempt->id());
  }
}

auto SequentialExecutor::metrics() const -> ExecutorMetrics {
  std::lock_guard lock(mu_);
  ExecutorMetrics m{.type = ExecutorType::Sequential,
                    .active = current_ ? 1u : 0u,
                    .capacity = 1,
                    .idle = current_ == nullptr};
  m.extra["running_task"] =
      current_ ? nlohmann::json(current_->id()) : nlohmann::json(nullptr);
  return m;
}

auto create_sequential_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<SequentialExecutor>();
}

}  // namespace taskcore
