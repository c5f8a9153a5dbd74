#include "taskcore/executor/deadline_timer.hpp"

#include "taskcore/core/constants.hpp"

#include <algorithm>
#include <vector>

namespace taskcore {

DeadlineTimer::DeadlineTimer() : thread_([this] { run(); }) {
}

DeadlineTimer::~DeadlineTimer() {
  stop();
}

auto DeadlineTimer::schedule(std::chrono::milliseconds after, Callback cb)
    -> TimerId {
  TimerId id;
  {
    std::lock_guard lock(mu_);
    id = next_id_++;
    auto delay = std::clamp<std::chrono::milliseconds>(
        after, std::chrono::milliseconds::zero(), timing::kMaxTaskTimeout);
    auto it = schedule_.emplace(clock::now() + delay, id);
    timers_.emplace(id, std::make_pair(it, std::move(cb)));
  }
  cv_.notify_one();
  return id;
}

auto DeadlineTimer::cancel(TimerId id) -> bool {
  std::lock_guard lock(mu_);
  auto it = timers_.find(id);
  if (it == timers_.end()) {
    return false;
  }
  schedule_.erase(it->second.first);
  timers_.erase(it);
  return true;
}

auto DeadlineTimer::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    schedule_.clear();
    timers_.clear();
  }
  cv_.notify_one();
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto DeadlineTimer::pending() const -> std::size_t {
  std::lock_guard lock(mu_);
  return timers_.size();
}

auto DeadlineTimer::run() -> void {
  std::unique_lock lock(mu_);
  while (!stopping_) {
    if (schedule_.empty()) {
      cv_.wait(lock);
      continue;
    }

    auto next = schedule_.begin()->first;
    if (clock::now() < next) {
      cv_.wait_until(lock, next);
      continue;
    }

    std::vector<Callback> due;
    auto now = clock::now();
    while (!schedule_.empty() && schedule_.begin()->first <= now) {
      auto id = schedule_.begin()->second;
      schedule_.erase(schedule_.begin());
      auto it = timers_.find(id);
      if (it != timers_.end()) {
        due.push_back(std::move(it->second.second));
        timers_.erase(it);
      }
    }

    lock.unlock();
    for (auto& cb : due) {
      cb();
    }
    lock.lock();
  }
}

}  // namespace taskcore
