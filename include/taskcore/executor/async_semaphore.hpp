#pragma once

#include "taskcore/core/coroutine.hpp"

#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace taskcore {

// Counting semaphore for coroutines: acquire() suspends instead of blocking.
// Woken waiters are handed back to the scheduler rather than resumed inline.
class AsyncSemaphore {
public:
  class Guard {
  public:
    explicit Guard(AsyncSemaphore& sem) : sem_(&sem) {
    }

    ~Guard() {
      if (sem_) {
        sem_->release();
      }
    }

    Guard(Guard&& other) noexcept : sem_(std::exchange(other.sem_, nullptr)) {
    }
    Guard& operator=(Guard&& other) noexcept {
      if (this != &other) {
        if (sem_)
          sem_->release();
        sem_ = std::exchange(other.sem_, nullptr);
      }
      return *this;
    }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

  private:
    AsyncSemaphore* sem_;
  };

  class AcquireAwaitable {
  public:
    explicit AcquireAwaitable(AsyncSemaphore& sem) : sem_(sem) {
    }

    [[nodiscard]] auto await_ready() -> bool {
      std::lock_guard lock(sem_.mu_);
      if (sem_.count_ > 0) {
        --sem_.count_;
        return true;
      }
      return false;
    }

    auto await_suspend(std::coroutine_handle<> h) -> bool {
      std::lock_guard lock(sem_.mu_);
      if (sem_.count_ > 0) {
        --sem_.count_;
        return false;
      }
      sem_.waiters_.push_back(h);
      return true;
    }

    [[nodiscard]] auto await_resume() -> Guard {
      return Guard(sem_);
    }

  private:
    AsyncSemaphore& sem_;
  };

  AsyncSemaphore(std::size_t initial_count, scheduler& sched)
      : count_(initial_count), sched_(sched) {
  }

  AsyncSemaphore(const AsyncSemaphore&) = delete;
  AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

  [[nodiscard]] auto acquire() -> AcquireAwaitable {
    return AcquireAwaitable(*this);
  }

  auto release() -> void {
    std::coroutine_handle<> to_wake;
    {
      std::lock_guard lock(mu_);
      if (!waiters_.empty()) {
        to_wake = waiters_.front();
        waiters_.pop_front();
      } else {
        ++count_;
      }
    }

    if (to_wake) {
      sched_.schedule(to_wake);
    }
  }

  [[nodiscard]] auto available() const -> std::size_t {
    std::lock_guard lock(mu_);
    return count_;
  }

  [[nodiscard]] auto waiting() const -> std::size_t {
    std::lock_guard lock(mu_);
    return waiters_.size();
  }

private:
  mutable std::mutex mu_;
  std::size_t count_;
  std::deque<std::coroutine_handle<>> waiters_;
  scheduler& sched_;
};

}  // namespace taskcore
