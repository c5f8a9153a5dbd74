#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace taskcore {

// One background thread firing callbacks at their deadlines. Callbacks run on
// the timer thread and must not block.
class DeadlineTimer {
public:
  using clock = std::chrono::steady_clock;
  using TimerId = std::uint64_t;
  using Callback = std::move_only_function<void()>;

  DeadlineTimer();
  ~DeadlineTimer();

  DeadlineTimer(const DeadlineTimer&) = delete;
  DeadlineTimer& operator=(const DeadlineTimer&) = delete;

  // `after` is clamped to [0, timing::kMaxTaskTimeout].
  auto schedule(std::chrono::milliseconds after, Callback cb) -> TimerId;

  // Returns false if the timer already fired or never existed.
  auto cancel(TimerId id) -> bool;

  auto stop() -> void;

  [[nodiscard]] auto pending() const -> std::size_t;

private:
  auto run() -> void;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::multimap<clock::time_point, TimerId> schedule_;
  std::unordered_map<TimerId,
                     std::pair<std::multimap<clock::time_point, TimerId>::iterator,
                               Callback>>
      timers_;
  TimerId next_id_{1};
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace taskcore
