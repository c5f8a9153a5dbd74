#include "taskcore/executor/worker_pool_executor.hpp"

#include "taskcore/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace taskcore {

WorkerPoolExecutor::WorkerPoolExecutor(std::size_t workers)
    : worker_count_(workers) {
  if (worker_count_ == 0) {
    worker_count_ = std::max(1u, std::thread::hardware_concurrency());
  }
  workers_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  log::debug("Worker pool started with {} thread(s)", worker_count_);
}

WorkerPoolExecutor::~WorkerPoolExecutor() {
  shutdown(false);
}

auto WorkerPoolExecutor::start(ExecutionRequest request,
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
  queue_.push_back(seq);
  lock.unlock();
  cv_.notify_one();
}

auto WorkerPoolExecutor::worker_loop() -> void {
  while (true) {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
    if (queue_.empty()) {
      break;
    }

    auto seq = queue_.front();
    queue_.pop_front();
    auto it = units_.find(seq);
    if (it == units_.end()) {
      continue;
    }
    auto attempt = it->second.attempt;
    if (attempt->settled()) {
      // timed out while queued
      units_.erase(it);
      continue;
    }
    it->second.state = UnitState::Running;
    ++running_;
    lock.unlock();

    auto ctx = attempt->context();
    attempt->settle(invoke_job(*attempt->request().job, ctx));

    lock.lock();
    --running_;
    it = units_.find(seq);
    if (it != units_.end()) {
      if (it->second.timer) {
        timer_.cancel(*it->second.timer);
      }
      units_.erase(it);
    }
    lock.unlock();
    cv_.notify_all();
  }
}

auto WorkerPoolExecutor::cancel(const TaskId& id) -> bool {
  AttemptPtr attempt;
  {
    std::lock_guard lock(mu_);
    auto it = std::ranges::find_if(units_, [&](const auto& entry) {
      return entry.second.state == UnitState::Queued &&
             entry.second.attempt->id() == id;
    });
    if (it == units_.end()) {
      return false;
    }
    attempt = it->second.attempt;
    if (it->second.timer) {
      timer_.cancel(*it->second.timer);
    }
    std::erase(queue_, it->first);
    units_.erase(it);
  }

  attempt->request_cancel();
  return attempt->settle(
      std::unexpected{task_errors::cancelled(id, "cancelled by user")});
}

auto WorkerPoolExecutor::shutdown(bool wait) -> void {
  std::vector<AttemptPtr> dropped;
  {
    std::lock_guard lock(mu_);
    if (stopping_ && workers_.empty()) {
      return;
    }
    stopping_ = true;
    if (!wait) {
      for (auto seq : queue_) {
        if (auto it = units_.find(seq); it != units_.end()) {
          dropped.push_back(it->second.attempt);
          units_.erase(it);
        }
      }
      queue_.clear();
      for (auto& [seq, unit] : units_) {
        unit.attempt->request_cancel();
      }
    }
  }
  cv_.notify_all();

  for (auto& attempt : dropped) {
    attempt->request_cancel();
    attempt->settle(std::unexpected{
        task_errors::cancelled(attempt->id(), "executor shutdown")});
  }

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  timer_.stop();
}

auto WorkerPoolExecutor::metrics() const -> ExecutorMetrics {
  std::lock_guard lock(mu_);
  ExecutorMetrics m{.type = ExecutorType::ThreadPool,
                    .active = running_,
                    .capacity = worker_count_,
                    .idle = running_ == 0 && queue_.empty()};
  m.extra["max_workers"] = worker_count_;
  m.extra["active_workers"] = running_;
  m.extra["queued"] = queue_.size();
  return m;
}

auto create_worker_pool_executor(std::size_t workers)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<WorkerPoolExecutor>(workers);
}

}  // namespace taskcore
