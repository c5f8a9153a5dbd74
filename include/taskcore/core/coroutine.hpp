#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <memory>
#include <new>
#include <optional>
#include <semaphore>
#include <type_traits>
#include <utility>

namespace taskcore {

template <typename T>
class task;

class scheduler {
public:
  virtual ~scheduler() = default;
  virtual auto schedule(std::coroutine_handle<> handle) noexcept -> void = 0;
  [[nodiscard]] virtual auto is_current_carrier() const noexcept -> bool = 0;
};

template <typename T>
class deferred_init {
public:
  deferred_init() noexcept = default;
  ~deferred_init() noexcept(std::is_nothrow_destructible_v<T>) {
    if (initialized_) {
      std::destroy_at(std::launder(reinterpret_cast<T*>(&storage_)));
    }
  }

  deferred_init(const deferred_init&) = delete;
  deferred_init& operator=(const deferred_init&) = delete;
  deferred_init(deferred_init&&) = delete;
  deferred_init& operator=(deferred_init&&) = delete;

  template <typename... Args>
    requires std::is_constructible_v<T, Args...>
  auto
  emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>)
      -> void {
    std::construct_at(reinterpret_cast<T*>(&storage_),
                      std::forward<Args>(args)...);
    initialized_ = true;
  }

  [[nodiscard]] auto get() && noexcept -> T&& {
    return std::move(*std::launder(reinterpret_cast<T*>(&storage_)));
  }

private:
  alignas(T) std::byte storage_[sizeof(T)];
  bool initialized_ = false;
};

class final_awaiter {
public:
  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  template <typename Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) const noexcept
      -> std::coroutine_handle<> {
    auto continuation = h.promise().continuation();
    if (continuation) {
      return continuation;
    }
    return std::noop_coroutine();
  }

  auto await_resume() const noexcept -> void {
  }
};

class promise_base {
public:
  [[nodiscard]] auto initial_suspend() const noexcept -> std::suspend_always {
    return {};
  }
  [[nodiscard]] auto final_suspend() const noexcept -> final_awaiter {
    return {};
  }

  // Exceptions escaping a task body are rethrown to the awaiter.
  auto unhandled_exception() noexcept -> void {
    exception_ = std::current_exception();
  }

  [[nodiscard]] auto continuation() const noexcept -> std::coroutine_handle<> {
    return continuation_;
  }

  auto set_continuation(std::coroutine_handle<> c) noexcept -> void {
    continuation_ = c;
  }

protected:
  auto rethrow_if_failed() const -> void {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }

private:
  std::coroutine_handle<> continuation_;
  std::exception_ptr exception_;
};

template <typename T>
class task_promise : public promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<T>;

  template <typename U>
    requires std::convertible_to<U&&, T>
  auto return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>)
      -> void {
    result_.emplace(std::forward<U>(value));
  }

  [[nodiscard]] auto take_result() -> T {
    rethrow_if_failed();
    return std::move(result_).get();
  }

private:
  deferred_init<T> result_;
};

template <>
class task_promise<void> : public promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<void>;

  auto return_void() const noexcept -> void {
  }

  auto take_result() -> void {
    rethrow_if_failed();
  }
};

// Lazily started coroutine. The task object owns the frame; awaiting it
// transfers ownership to the awaiter, which destroys the frame on resume.
template <typename T = void>
class [[nodiscard]] task {
public:
  using promise_type = task_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  task() noexcept = default;
  explicit task(handle_type h) noexcept : handle_(h) {
  }

  task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {
  }

  task& operator=(task&& other) noexcept {
    if (this != &other) {
      destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  task(const task&) = delete;
  task& operator=(const task&) = delete;

  ~task() {
    destroy();
  }

  [[nodiscard]] auto done() const noexcept -> bool {
    return !handle_ || handle_.done();
  }

  class awaiter {
  public:
    explicit awaiter(handle_type h) noexcept : handle_(h) {
    }

    awaiter(const awaiter&) = delete;
    awaiter& operator=(const awaiter&) = delete;

    ~awaiter() {
      if (handle_) {
        handle_.destroy();
      }
    }

    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return !handle_ || handle_.done();
    }

    auto await_suspend(std::coroutine_handle<> continuation) noexcept
        -> std::coroutine_handle<> {
      handle_.promise().set_continuation(continuation);
      return handle_;
    }

    auto await_resume() -> T {
      return handle_.promise().take_result();
    }

  private:
    handle_type handle_;
  };

  [[nodiscard]] auto operator co_await() && noexcept -> awaiter {
    return awaiter{std::exchange(handle_, nullptr)};
  }

private:
  auto destroy() noexcept -> void {
    if (handle_) {
      handle_.destroy();
      handle_ = nullptr;
    }
  }

  handle_type handle_;
};

template <typename T>
auto task_promise<T>::get_return_object() noexcept -> task<T> {
  return task<T>{std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline auto task_promise<void>::get_return_object() noexcept -> task<void> {
  return task<void>{
      std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

// Fire-and-forget coroutine. The frame frees itself on completion, so the
// body must not let exceptions escape.
class detached_task {
public:
  struct promise_type {
    auto get_return_object() noexcept -> detached_task {
      return detached_task{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    auto initial_suspend() const noexcept -> std::suspend_always {
      return {};
    }
    auto final_suspend() const noexcept -> std::suspend_never {
      return {};
    }
    auto return_void() const noexcept -> void {
    }
    [[noreturn]] auto unhandled_exception() const noexcept -> void {
      std::terminate();
    }
  };

  detached_task(detached_task&& other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)) {
  }
  detached_task& operator=(detached_task&&) = delete;
  detached_task(const detached_task&) = delete;
  detached_task& operator=(const detached_task&) = delete;

  ~detached_task() {
    if (handle_) {
      handle_.destroy();
    }
  }

  [[nodiscard]] auto take() noexcept -> std::coroutine_handle<> {
    return std::exchange(handle_, nullptr);
  }

private:
  explicit detached_task(std::coroutine_handle<promise_type> h) noexcept
      : handle_(h) {
  }

  std::coroutine_handle<promise_type> handle_;
};

inline thread_local scheduler* current_scheduler_ptr = nullptr;

[[nodiscard]] inline auto current_scheduler() noexcept -> scheduler* {
  return current_scheduler_ptr;
}

namespace detail {

template <typename T>
struct sync_state {
  std::binary_semaphore done{0};
  std::optional<T> value;
  std::exception_ptr error;
};

template <>
struct sync_state<void> {
  std::binary_semaphore done{0};
  std::exception_ptr error;
};

template <typename T>
auto sync_driver(task<T> t, sync_state<T>& state) -> detached_task {
  try {
    if constexpr (std::is_void_v<T>) {
      co_await std::move(t);
    } else {
      state.value.emplace(co_await std::move(t));
    }
  } catch (...) {
    state.error = std::current_exception();
  }
  state.done.release();
}

}  // namespace detail

// Runs `t` on the calling thread and blocks until it finishes. If the task
// suspends, whichever thread resumes it completes the wait.
template <typename T>
auto sync_wait(task<T> t) -> T {
  detail::sync_state<T> state;
  detail::sync_driver(std::move(t), state).take().resume();
  state.done.acquire();
  if (state.error) {
    std::rethrow_exception(state.error);
  }
  if constexpr (!std::is_void_v<T>) {
    return std::move(*state.value);
  }
}

}  // namespace taskcore
