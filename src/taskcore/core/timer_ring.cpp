#include "taskcore/core/timer_ring.hpp"

#include "taskcore/core/constants.hpp"
#include "taskcore/util/log.hpp"

#include <poll.h>
#include <unistd.h>

namespace taskcore {

namespace {

auto to_timespec(std::chrono::nanoseconds d) -> __kernel_timespec {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
  return {.tv_sec = secs.count(), .tv_nsec = (d - secs).count()};
}

}  // namespace

TimerRing::TimerRing() {
  auto rc = io_uring_queue_init(limits::kTimerRingEntries, &ring_, 0);
  if (rc != 0) {
    log::warn("io_uring unavailable ({}), carrier falls back to local timers",
              -rc);
    return;
  }
  valid_ = true;
}

TimerRing::~TimerRing() {
  if (valid_) {
    io_uring_queue_exit(&ring_);
  }
}

auto TimerRing::arm(SleepSlot& slot, std::chrono::nanoseconds duration)
    -> bool {
  if (!valid_) {
    return false;
  }
  auto* sqe = io_uring_get_sqe(&ring_);
  if (sqe == nullptr) {
    flush();
    sqe = io_uring_get_sqe(&ring_);
    if (sqe == nullptr) {
      return false;
    }
  }
  slot.ts = to_timespec(duration);
  io_uring_prep_timeout(sqe, &slot.ts, 0, 0);
  io_uring_sqe_set_data(sqe, &slot);
  dirty_ = true;
  return true;
}

auto TimerRing::watch_wake_fd(int fd) -> void {
  if (!valid_ || fd < 0) {
    return;
  }
  wake_fd_ = fd;
  auto* sqe = io_uring_get_sqe(&ring_);
  if (sqe == nullptr) {
    flush();
    sqe = io_uring_get_sqe(&ring_);
    if (sqe == nullptr) {
      log::warn("Timer ring full, wake poll on fd {} not armed", fd);
      return;
    }
  }
  io_uring_prep_poll_multishot(sqe, fd, POLLIN);
  io_uring_sqe_set_data(sqe, nullptr);
  dirty_ = true;
  flush();
}

auto TimerRing::flush() -> void {
  if (!valid_ || !dirty_) {
    return;
  }
  dirty_ = false;
  if (auto rc = io_uring_submit(&ring_); rc < 0) {
    log::error("io_uring_submit failed: {}", -rc);
  }
}

auto TimerRing::wait(std::chrono::milliseconds timeout) -> void {
  if (!valid_) {
    return;
  }
  flush();
  auto ts = to_timespec(timeout);
  io_uring_cqe* cqe = nullptr;
  // -ETIME and -EINTR both just mean "go look again".
  (void)io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
}

auto TimerRing::consume_wake() -> void {
  std::uint64_t count = 0;
  while (read(wake_fd_, &count, sizeof(count)) > 0) {
  }
}

}  // namespace taskcore
