#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>

#include <liburing.h>

namespace taskcore {

// Where a suspended sleeper learns how its timeout ended. Owned by the sleep
// awaiter, so it lives in the coroutine frame until the waiter resumes.
struct SleepSlot {
  std::coroutine_handle<> waiter;
  std::int32_t result{0};
  __kernel_timespec ts{};
};

// Per-carrier io_uring used for two things only: one-shot timeouts that wake
// sleeping coroutines, and a multishot poll on the carrier's eventfd so a
// remote schedule() interrupts wait().
class TimerRing {
public:
  TimerRing();
  ~TimerRing();

  TimerRing(const TimerRing&) = delete;
  TimerRing& operator=(const TimerRing&) = delete;

  // False when io_uring could not be set up; callers keep their own timers.
  [[nodiscard]] auto valid() const noexcept -> bool {
    return valid_;
  }

  // Queues a timeout for `slot`. False if the submission queue stayed full
  // after a flush.
  [[nodiscard]] auto arm(SleepSlot& slot, std::chrono::nanoseconds duration)
      -> bool;

  auto watch_wake_fd(int fd) -> void;

  // Submits everything queued since the last flush.
  auto flush() -> void;

  // Reaps completions. Wake polls are consumed here and re-armed if the
  // kernel dropped them; each finished timeout is handed to `on_timeout`.
  template <typename OnTimeout>
  auto drain(OnTimeout&& on_timeout) -> unsigned {
    if (!valid_) {
      return 0;
    }
    io_uring_cqe* cqe = nullptr;
    unsigned head = 0;
    unsigned seen = 0;
    unsigned timeouts = 0;
    bool rearm_wake = false;

    io_uring_for_each_cqe(&ring_, head, cqe) {
      ++seen;
      auto* slot = static_cast<SleepSlot*>(io_uring_cqe_get_data(cqe));
      if (slot == nullptr) {
        consume_wake();
        rearm_wake |= (cqe->flags & IORING_CQE_F_MORE) == 0;
        continue;
      }
      slot->result = cqe->res;
      on_timeout(*slot);
      ++timeouts;
    }
    io_uring_cq_advance(&ring_, seen);

    if (rearm_wake) {
      watch_wake_fd(wake_fd_);
    }
    return timeouts;
  }

  // Blocks until a completion arrives or `timeout` passes.
  auto wait(std::chrono::milliseconds timeout) -> void;

private:
  auto consume_wake() -> void;

  io_uring ring_{};
  bool valid_{false};
  bool dirty_{false};
  int wake_fd_{-1};
};

}  // namespace taskcore
