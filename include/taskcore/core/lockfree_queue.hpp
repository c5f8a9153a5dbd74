#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <thread>

namespace taskcore {

#ifdef __cpp_lib_hardware_interference_size
inline constexpr std::size_t kCacheLineSize =
    std::hardware_destructive_interference_size;
#else
inline constexpr std::size_t kCacheLineSize = 64;
#endif

// Fixed-capacity ring shared by many producers and drained by one consumer
// (log lines into the writer thread, coroutine handles into a carrier).
// Each cell's turn counter says whose move it is: a producer may fill the
// cell when turn == its ticket, the consumer may empty it when turn ==
// ticket + 1. Capacity is rounded up to a power of two.
template <typename T>
  requires std::move_constructible<T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : size_{std::bit_ceil(std::max<std::size_t>(capacity, 2))},
        cells_{std::make_unique<Cell[]>(size_)} {
    for (std::size_t i = 0; i < size_; ++i) {
      cells_[i].turn.store(i, std::memory_order_relaxed);
    }
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;

  // False when the ring is full.
  [[nodiscard]] auto push(T value) -> bool {
    return try_push(value);
  }

  // Moves from `value` only on success, so a full ring can be retried with
  // the same object.
  auto try_push(T& value) -> bool {
    auto ticket = enqueue_.load(std::memory_order_relaxed);
    while (true) {
      Cell& cell = cell_at(ticket);
      auto turn = cell.turn.load(std::memory_order_acquire);
      if (turn == ticket) {
        if (enqueue_.compare_exchange_weak(ticket, ticket + 1,
                                           std::memory_order_relaxed)) {
          cell.value.emplace(std::move(value));
          cell.turn.store(ticket + 1, std::memory_order_release);
          return true;
        }
      } else if (turn < ticket) {
        return false;
      } else {
        ticket = enqueue_.load(std::memory_order_relaxed);
      }
    }
  }

  // Spins (yielding) until there is room.
  auto push_blocking(T value) -> void {
    while (!try_push(value)) {
      std::this_thread::yield();
    }
  }

  // Consumer side only.
  [[nodiscard]] auto try_pop() -> std::optional<T> {
    auto ticket = dequeue_.load(std::memory_order_relaxed);
    Cell& cell = cell_at(ticket);
    if (cell.turn.load(std::memory_order_acquire) != ticket + 1) {
      return std::nullopt;
    }
    std::optional<T> out{std::move(*cell.value)};
    cell.value.reset();
    cell.turn.store(ticket + size_, std::memory_order_release);
    dequeue_.store(ticket + 1, std::memory_order_relaxed);
    return out;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return enqueue_.load(std::memory_order_acquire) ==
           dequeue_.load(std::memory_order_acquire);
  }

  // Racy under concurrent pushes; exact once producers are quiet.
  [[nodiscard]] auto size_approx() const noexcept -> std::size_t {
    auto head = enqueue_.load(std::memory_order_acquire);
    auto tail = dequeue_.load(std::memory_order_acquire);
    return head >= tail ? head - tail : 0;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return size_;
  }

private:
  struct Cell {
    std::atomic<std::size_t> turn{0};
    std::optional<T> value;
  };

  auto cell_at(std::size_t ticket) noexcept -> Cell& {
    return cells_[ticket & (size_ - 1)];
  }

  const std::size_t size_;
  std::unique_ptr<Cell[]> cells_;
  alignas(kCacheLineSize) std::atomic<std::size_t> enqueue_{0};
  alignas(kCacheLineSize) std::atomic<std::size_t> dequeue_{0};
};

}  // namespace taskcore
