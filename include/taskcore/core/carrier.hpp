#pragma once

#include "taskcore/core/constants.hpp"
#include "taskcore/core/lockfree_queue.hpp"
#include "taskcore/core/timer_ring.hpp"

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <map>

namespace taskcore {

using carrier_id = unsigned;
inline constexpr carrier_id kNoCarrier = ~0u;

// One carrier thread's run queues and sleepers. Only the owning thread
// touches anything except schedule_remote() and wake().
class Carrier {
public:
  using clock = std::chrono::steady_clock;

  explicit Carrier(carrier_id id);
  ~Carrier();

  Carrier(const Carrier&) = delete;
  Carrier& operator=(const Carrier&) = delete;

  [[nodiscard]] auto id() const noexcept -> carrier_id {
    return id_;
  }

  auto schedule_local(std::coroutine_handle<> h) -> void;
  [[nodiscard]] auto schedule_remote(std::coroutine_handle<> h) -> bool;

  // Resumes slot.waiter after `duration`: on the ring when it has room,
  // otherwise from the local deadline map.
  auto sleep(SleepSlot& slot, std::chrono::nanoseconds duration) -> void;

  // One pass over ready coroutines, due sleepers and ring completions.
  auto run_once() -> bool;

  // Blocks until woken, a sleeper is due, or the idle wait passes.
  auto park() -> void;
  auto wake() -> void;

  auto attach() -> void;

  [[nodiscard]] auto suspended_count() const noexcept -> std::size_t;

private:
  auto run_ready() -> bool;
  auto run_due_sleepers() -> bool;
  [[nodiscard]] auto has_ready_work() const noexcept -> bool;
  [[nodiscard]] auto until_next_deadline() const noexcept
      -> std::chrono::milliseconds;

  carrier_id id_;
  int wake_fd_{-1};
  TimerRing ring_;

  std::deque<std::coroutine_handle<>> local_queue_;
  BoundedMPSCQueue<std::coroutine_handle<>> remote_queue_{
      limits::kCarrierRemoteQueueSize};
  std::size_t armed_{0};
  std::multimap<clock::time_point, SleepSlot*> deadlines_;
};

}  // namespace taskcore
