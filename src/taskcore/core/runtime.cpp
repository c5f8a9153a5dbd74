#include "taskcore/core/runtime.hpp"

#include "taskcore/core/constants.hpp"
#include "taskcore/util/log.hpp"

#include <ranges>

namespace taskcore {

Runtime::Runtime(unsigned num_carriers) {
  if (num_carriers == 0) {
    num_carriers = std::thread::hardware_concurrency();
    if (num_carriers == 0)
      num_carriers = 1;
  }
  num_carriers_ = num_carriers;

  carriers_.reserve(num_carriers);
  for (auto i : std::views::iota(0u, num_carriers)) {
    carriers_.emplace_back(std::make_unique<Carrier>(i));
  }
}

Runtime::~Runtime() {
  stop();
}

auto Runtime::start() -> void {
  if (running_.exchange(true))
    return;
  stop_requested_.store(false);

  threads_.reserve(num_carriers_);
  for (auto i : std::views::iota(0u, num_carriers_)) {
    threads_.emplace_back([this, i] { run_carrier(i); });
  }
  log::debug("Runtime started with {} carrier(s)", num_carriers_);
}

auto Runtime::stop() -> void {
  if (!running_.exchange(false))
    return;
  stop_requested_.store(true);

  for (auto i : std::views::iota(0u, num_carriers_)) {
    wake_carrier(i);
  }

  for (auto& t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();

  std::size_t abandoned = 0;
  for (auto& carrier : carriers_) {
    abandoned += carrier->suspended_count();
  }
  if (abandoned > 0) {
    log::warn("Runtime stopped with {} suspended coroutine(s) abandoned",
              abandoned);
  }
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::run_carrier(carrier_id id) -> void {
  detail::current_carrier_id = id;
  detail::current_runtime = this;
  current_scheduler_ptr = this;

  auto& carrier = *carriers_[id];
  carrier.attach();

  while (!stop_requested_.load(std::memory_order_acquire)) {
    if (!carrier.run_once()) {
      carrier.park();
    }
  }
  (void)carrier.run_once();

  current_scheduler_ptr = nullptr;
  detail::current_carrier_id = kNoCarrier;
  detail::current_runtime = nullptr;
}

auto Runtime::schedule(std::coroutine_handle<> handle) noexcept -> void {
  if (!handle || handle.done())
    return;

  if (is_current_carrier()) {
    carriers_[detail::current_carrier_id]->schedule_local(handle);
  } else {
    schedule_external(handle);
  }
}

auto Runtime::is_current_carrier() const noexcept -> bool {
  return detail::current_carrier_id != kNoCarrier &&
         this == detail::current_runtime;
}

auto Runtime::schedule_on(carrier_id target, std::coroutine_handle<> handle)
    -> void {
  if (!handle || handle.done())
    return;

  if (is_current_carrier() && target == detail::current_carrier_id) {
    carriers_[target]->schedule_local(handle);
  } else {
    while (!carriers_[target]->schedule_remote(handle)) {
      std::this_thread::yield();
    }
    wake_carrier(target);
  }
}

auto Runtime::schedule_external(std::coroutine_handle<> handle) -> void {
  auto target = next_carrier_.fetch_add(1, std::memory_order_relaxed) %
                num_carriers_;
  schedule_on(target, handle);
}

auto Runtime::spawn(detached_task t) -> void {
  schedule_external(t.take());
}

auto Runtime::sleep_current(SleepSlot& slot, std::chrono::nanoseconds duration)
    -> void {
  carriers_[detail::current_carrier_id]->sleep(slot, duration);
}

auto Runtime::wake_carrier(carrier_id id) -> void {
  if (id < num_carriers_) {
    carriers_[id]->wake();
  }
}

auto sleep_awaiter::await_ready() const -> bool {
  if (token_.is_cancelled() || duration_ <= std::chrono::nanoseconds::zero()) {
    return true;
  }
  if (!on_carrier()) {
    (void)token_.wait_for(duration_);
    return true;
  }
  return false;
}

auto sleep_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> void {
  slot_.waiter = handle;
  detail::current_runtime->sleep_current(slot_, duration_);
}

}  // namespace taskcore
