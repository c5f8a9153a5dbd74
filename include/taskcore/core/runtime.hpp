#pragma once

#include "taskcore/core/cancellation.hpp"
#include "taskcore/core/carrier.hpp"
#include "taskcore/core/coroutine.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace taskcore {

// A fixed set of carrier threads that multiplex coroutines. Handles are only
// resumed here, never destroyed: task<T> frames belong to their owners and
// detached_task frames free themselves.
class Runtime : public scheduler {
public:
  explicit Runtime(unsigned num_carriers = 0);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  auto schedule(std::coroutine_handle<> handle) noexcept -> void override;
  [[nodiscard]] auto is_current_carrier() const noexcept -> bool override;

  auto schedule_on(carrier_id target, std::coroutine_handle<> handle) -> void;
  auto schedule_external(std::coroutine_handle<> handle) -> void;
  auto spawn(detached_task t) -> void;

  [[nodiscard]] auto carrier_count() const noexcept -> unsigned {
    return num_carriers_;
  }

private:
  friend class sleep_awaiter;

  auto sleep_current(SleepSlot& slot, std::chrono::nanoseconds duration)
      -> void;

  auto run_carrier(carrier_id id) -> void;
  auto wake_carrier(carrier_id id) -> void;

  unsigned num_carriers_;
  std::vector<std::unique_ptr<Carrier>> carriers_;
  std::vector<std::thread> threads_;
  std::atomic<unsigned> next_carrier_{0};

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

namespace detail {
inline thread_local carrier_id current_carrier_id = kNoCarrier;
inline thread_local Runtime* current_runtime = nullptr;
}  // namespace detail

[[nodiscard]] inline auto on_carrier() noexcept -> bool {
  return detail::current_runtime != nullptr;
}

// Suspends the coroutine for `duration` when awaited on a carrier. Anywhere
// else it blocks the calling thread instead, waking early on cancellation.
class sleep_awaiter {
public:
  sleep_awaiter(std::chrono::nanoseconds duration,
                CancellationToken token) noexcept
      : duration_{duration}, token_{std::move(token)} {
  }

  sleep_awaiter(const sleep_awaiter&) = delete;
  sleep_awaiter& operator=(const sleep_awaiter&) = delete;
  sleep_awaiter(sleep_awaiter&&) = delete;
  sleep_awaiter& operator=(sleep_awaiter&&) = delete;

  [[nodiscard]] auto await_ready() const -> bool;
  auto await_suspend(std::coroutine_handle<> handle) noexcept -> void;
  [[nodiscard]] auto await_resume() const noexcept -> bool {
    return !token_.is_cancelled();
  }

private:
  SleepSlot slot_{};
  std::chrono::nanoseconds duration_;
  CancellationToken token_;
};

// Requeues the coroutine behind other ready work on its carrier.
class yield_awaiter {
public:
  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return !on_carrier();
  }
  auto await_suspend(std::coroutine_handle<> handle) const noexcept -> void {
    detail::current_runtime->schedule(handle);
  }
  auto await_resume() const noexcept -> void {
  }
};

[[nodiscard]] inline auto
async_sleep(std::chrono::nanoseconds duration,
            CancellationToken token = CancellationToken::none()) noexcept
    -> sleep_awaiter {
  return sleep_awaiter{duration, std::move(token)};
}

[[nodiscard]] inline auto yield_now() noexcept -> yield_awaiter {
  return {};
}

}  // namespace taskcore
