#include "taskcore/core/carrier.hpp"

#include "taskcore/util/log.hpp"

#include <sys/eventfd.h>

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <thread>

namespace taskcore {

namespace {

auto resume_if_live(std::coroutine_handle<> h) -> bool {
  if (h && !h.done()) {
    h.resume();
    return true;
  }
  return false;
}

}  // namespace

Carrier::Carrier(carrier_id id) : id_(id) {
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd for carrier {}: errno {}", id, errno);
  }
}

Carrier::~Carrier() {
  if (wake_fd_ >= 0) {
    close(wake_fd_);
  }
}

auto Carrier::attach() -> void {
  ring_.watch_wake_fd(wake_fd_);
}

auto Carrier::schedule_local(std::coroutine_handle<> h) -> void {
  if (h && !h.done()) {
    local_queue_.push_back(h);
  }
}

auto Carrier::schedule_remote(std::coroutine_handle<> h) -> bool {
  return remote_queue_.push(h);
}

auto Carrier::sleep(SleepSlot& slot, std::chrono::nanoseconds duration)
    -> void {
  if (ring_.arm(slot, duration)) {
    ++armed_;
    return;
  }
  deadlines_.emplace(clock::now() + duration, &slot);
}

auto Carrier::run_once() -> bool {
  bool progressed = run_ready();
  progressed |= run_due_sleepers();
  ring_.flush();
  progressed |= ring_.drain([this](SleepSlot& slot) {
    if (armed_ > 0) {
      --armed_;
    }
    resume_if_live(slot.waiter);
  }) > 0;
  return progressed;
}

auto Carrier::run_ready() -> bool {
  bool progressed = false;

  std::deque<std::coroutine_handle<>> batch;
  batch.swap(local_queue_);
  for (auto h : batch) {
    progressed |= resume_if_live(h);
  }

  while (auto h = remote_queue_.try_pop()) {
    progressed |= resume_if_live(*h);
  }
  return progressed;
}

auto Carrier::run_due_sleepers() -> bool {
  bool progressed = false;
  auto now = clock::now();
  while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
    auto* slot = deadlines_.begin()->second;
    deadlines_.erase(deadlines_.begin());
    slot->result = -ETIME;
    progressed |= resume_if_live(slot->waiter);
  }
  return progressed;
}

auto Carrier::park() -> void {
  if (has_ready_work()) {
    return;
  }
  // A wake() that lands before the wait leaves the eventfd readable, so the
  // poll completes at once.
  if (ring_.valid()) {
    ring_.wait(std::min(until_next_deadline(), timing::kCarrierIdleWait));
  } else {
    std::this_thread::sleep_for(
        std::min(until_next_deadline(), timing::kCarrierFallbackSleep));
  }
}

auto Carrier::wake() -> void {
  if (wake_fd_ < 0) {
    return;
  }
  std::uint64_t one = 1;
  while (write(wake_fd_, &one, sizeof(one)) < 0 && errno == EINTR) {
  }
}

auto Carrier::has_ready_work() const noexcept -> bool {
  return !local_queue_.empty() || !remote_queue_.empty() ||
         (!deadlines_.empty() && deadlines_.begin()->first <= clock::now());
}

auto Carrier::until_next_deadline() const noexcept
    -> std::chrono::milliseconds {
  if (deadlines_.empty()) {
    return timing::kCarrierIdleWait;
  }
  auto wait = std::chrono::ceil<std::chrono::milliseconds>(
      deadlines_.begin()->first - clock::now());
  return std::max(wait, std::chrono::milliseconds::zero());
}

auto Carrier::suspended_count() const noexcept -> std::size_t {
  return local_queue_.size() + armed_ + deadlines_.size();
}

}  // namespace taskcore
