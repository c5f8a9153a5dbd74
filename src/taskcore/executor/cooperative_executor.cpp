#include "taskcore/executor/cooperative_executor.hpp"

#include "taskcore/core/constants.hpp"
#include "taskcore/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <ranges>
#include <typeinfo>
#include <vector>

namespace taskcore {

CooperativeExecutor::CooperativeExecutor(std::size_t max_concurrency,
                                         unsigned carrier_threads)
    : max_concurrency_(max_concurrency == 0 ? limits::kDefaultAsyncConcurrency
                                            : max_concurrency),
      runtime_(carrier_threads == 0 ? limits::kDefaultCarrierThreads
                                    : carrier_threads),
      semaphore_(max_concurrency_, runtime_) {
  runtime_.start();
  log::debug("Cooperative executor started: {} slot(s) on {} carrier(s)",
             max_concurrency_, runtime_.carrier_count());
}

CooperativeExecutor::~CooperativeExecutor() {
  shutdown(false);
}

auto CooperativeExecutor::start(ExecutionRequest request,
                                CompletionCallback callback) -> void {
  auto attempt =
      std::make_shared<Attempt>(std::move(request), std::move(callback));

  std::unique_lock lock(mu_);
  if (stopping_) {
    lock.unlock();
    attempt->settle(std::unexpected{
        task_errors::execution(attempt->id(), "Executor is shut down")});
    return;
  }

  Unit unit{.attempt = attempt};
  if (auto deadline = attempt->request().timeout) {
    unit.timer = timer_.schedule(*deadline, [attempt, limit = *deadline] {
      attempt->request_cancel();
      if (attempt->settle(
              std::unexpected{task_errors::timeout(attempt->id(), limit)})) {
        log::warn("Task {} timed out after {}", attempt->id(), limit);
      }
    });
  }
  auto seq = next_unit_++;
  units_.emplace(seq, std::move(unit));
  lock.unlock();

  runtime_.spawn(run_unit(*this, seq, std::move(attempt)));
}

auto CooperativeExecutor::run_unit(CooperativeExecutor& self,
                                   std::uint64_t seq, AttemptPtr attempt)
    -> detached_task {
  {
    auto permit = co_await self.semaphore_.acquire();
    if (!attempt->settled()) {
      self.mark_running(seq);
      auto outcome = co_await run_body(attempt);
      attempt->settle(std::move(outcome));
    }
  }
  self.finish_unit(seq);
}

auto CooperativeExecutor::run_body(AttemptPtr attempt)
    -> task<ExecutionOutcome> {
  auto ctx = attempt->context();
  std::optional<ExecutionOutcome> failure;
  try {
    auto result = co_await attempt->request().job->run_async(ctx);
    co_return to_outcome(ctx, std::move(result));
  } catch (const std::exception& e) {
    failure.emplace(std::unexpected{task_errors::execution(
        ctx.id(), std::format("Task {} failed: {}", ctx.id(), e.what()),
        ErrorCause{typeid(e).name(), e.what()})});
  } catch (...) {
    failure.emplace(std::unexpected{task_errors::execution(
        ctx.id(), std::format("Task {} failed: unknown exception", ctx.id()),
        ErrorCause{"unknown", "non-standard exception"})});
  }
  co_return std::move(*failure);
}

auto CooperativeExecutor::mark_running(std::uint64_t seq) -> void {
  std::lock_guard lock(mu_);
  if (auto it = units_.find(seq); it != units_.end()) {
    it->second.running = true;
    ++running_;
  }
}

auto CooperativeExecutor::finish_unit(std::uint64_t seq) -> void {
  {
    std::lock_guard lock(mu_);
    auto it = units_.find(seq);
    if (it == units_.end()) {
      return;
    }
    if (it->second.running) {
      --running_;
    }
    if (it->second.timer) {
      timer_.cancel(*it->second.timer);
    }
    units_.erase(it);
  }
  drained_cv_.notify_all();
}

auto CooperativeExecutor::cancel(const TaskId& id) -> bool {
  std::vector<AttemptPtr> matches;
  {
    std::lock_guard lock(mu_);
    for (auto& [seq, unit] : units_) {
      if (unit.attempt->id() == id && !unit.attempt->settled()) {
        matches.push_back(unit.attempt);
      }
    }
  }

  bool cancelled = false;
  for (auto& attempt : matches) {
    attempt->request_cancel();
    cancelled |= attempt->settle(
        std::unexpected{task_errors::cancelled(id, "cancelled by user")});
  }
  return cancelled;
}

auto CooperativeExecutor::shutdown(bool wait) -> void {
  std::vector<AttemptPtr> in_flight;
  {
    std::lock_guard lock(mu_);
    if (stopped_) {
      return;
    }
    stopping_ = true;
    if (!wait) {
      for (auto& [seq, unit] : units_) {
        in_flight.push_back(unit.attempt);
      }
    }
  }

  for (auto& attempt : in_flight) {
    attempt->request_cancel();
    attempt->settle(std::unexpected{
        task_errors::cancelled(attempt->id(), "executor shutdown")});
  }

  {
    std::unique_lock lock(mu_);
    auto drained = [this] { return units_.empty(); };
    if (wait) {
      drained_cv_.wait(lock, drained);
    } else if (!drained_cv_.wait_for(lock, timing::kShutdownGracePeriod,
                                     drained)) {
      log::warn("Cooperative executor abandoning {} unit(s) that ignored "
                "cancellation",
                units_.size());
    }
    stopped_ = true;
  }

  runtime_.stop();
  timer_.stop();
}

auto CooperativeExecutor::metrics() const -> ExecutorMetrics {
  std::lock_guard lock(mu_);
  ExecutorMetrics m{.type = ExecutorType::Async,
                    .active = running_,
                    .capacity = max_concurrency_,
                    .idle = units_.empty()};
  m.extra["max_concurrency"] = max_concurrency_;
  m.extra["active_tasks"] = units_.size();
  m.extra["available_slots"] = semaphore_.available();
  m.extra["carrier_threads"] = runtime_.carrier_count();
  return m;
}

auto create_cooperative_executor(std::size_t max_concurrency,
                                 unsigned carrier_threads)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<CooperativeExecutor>(max_concurrency,
                                               carrier_threads);
}

}  // namespace taskcore
