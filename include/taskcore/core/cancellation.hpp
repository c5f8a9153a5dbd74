#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace taskcore {

class CancellationToken;

class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  // Returns false if the source was already cancelled.
  auto cancel() noexcept -> bool {
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    {
      std::lock_guard lock(state_->mu);
    }
    state_->cv.notify_all();
    return true;
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mu;
    std::condition_variable cv;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  // Blocks for at most `duration`. Returns true if cancellation was observed.
  // A default-constructed token can never be cancelled and simply sleeps.
  template <typename Rep, typename Period>
  auto wait_for(std::chrono::duration<Rep, Period> duration) const -> bool {
    if (!state_) {
      std::this_thread::sleep_for(duration);
      return false;
    }
    std::unique_lock lock(state_->mu);
    return state_->cv.wait_for(lock, duration, [this] {
      return state_->cancelled.load(std::memory_order_acquire);
    });
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace taskcore
