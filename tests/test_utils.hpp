#pragma once

#include "taskcore/manager/event_publisher.hpp"
#include "taskcore/task/job.hpp"
#include "taskcore/util/id.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskcore::test {

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

template <typename T>
class BlockingQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cv_.notify_one();
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto try_pop_for(const std::chrono::duration<Rep, Period>& timeout)
      -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      T value = std::move(queue_.front());
      queue_.pop();
      return value;
    }
    return std::nullopt;
  }

private:
  std::queue<T> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
};

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
[[nodiscard]] auto wait_until(Pred pred,
                              std::chrono::milliseconds timeout =
                                  std::chrono::seconds(5)) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

// Opens once; every waiter passes from then on.
class Gate {
public:
  void open() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  template <typename Rep, typename Period>
  auto wait_for(const std::chrono::duration<Rep, Period>& timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return open_; });
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_{false};
};

struct RecordedEvent {
  EventType type;
  TaskId task_id;
  nlohmann::json payload;
};

class RecordingEventPublisher final : public IEventPublisher {
public:
  auto publish(EventType type, const TaskId& task_id,
               const nlohmann::json& payload) -> Result<void> override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({type, task_id, payload});
    return ok();
  }

  [[nodiscard]] auto events() const -> std::vector<RecordedEvent> {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  [[nodiscard]] auto of_type(EventType type) const
      -> std::vector<RecordedEvent> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecordedEvent> out;
    for (const auto& e : events_) {
      if (e.type == type) {
        out.push_back(e);
      }
    }
    return out;
  }

  [[nodiscard]] auto count(EventType type) const -> std::size_t {
    return of_type(type).size();
  }

private:
  mutable std::mutex mutex_;
  std::vector<RecordedEvent> events_;
};

class FailingEventPublisher final : public IEventPublisher {
public:
  explicit FailingEventPublisher(bool throw_instead) : throw_(throw_instead) {
  }

  auto publish(EventType, const TaskId&, const nlohmann::json&)
      -> Result<void> override {
    calls.fetch_add(1);
    if (throw_) {
      throw std::runtime_error("publisher down");
    }
    return fail(Error::Unknown);
  }

  std::atomic<int> calls{0};

private:
  bool throw_;
};

[[nodiscard]] inline auto value_job(nlohmann::json value)
    -> std::shared_ptr<IJob> {
  return make_job([value](TaskContext&) -> JobResult { return value; });
}

// Blocks (cancellably) for `duration`, then succeeds.
[[nodiscard]] inline auto sleeping_job(std::chrono::milliseconds duration)
    -> std::shared_ptr<IJob> {
  return make_job([duration](TaskContext& ctx) -> JobResult {
    if (!ctx.wait_for(duration)) {
      return job_failure("interrupted");
    }
    return nlohmann::json("slept");
  });
}

// Counts invocations and fails the first `failures` of them.
[[nodiscard]] inline auto flaky_job(std::shared_ptr<std::atomic<int>> calls,
                                    int failures) -> std::shared_ptr<IJob> {
  return make_job([calls, failures](TaskContext&) -> JobResult {
    auto n = calls->fetch_add(1) + 1;
    if (n <= failures) {
      return job_failure("transient", "TransientError");
    }
    return nlohmann::json(n);
  });
}

}  // namespace taskcore::test
