#pragma once

#include "taskcore/core/cancellation.hpp"
#include "taskcore/core/coroutine.hpp"
#include "taskcore/core/runtime.hpp"
#include "taskcore/task/task_error.hpp"
#include "taskcore/util/id.hpp"

#include <chrono>
#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

namespace taskcore {

using JobResult = std::expected<nlohmann::json, ErrorCause>;

[[nodiscard]] inline auto job_failure(std::string message,
                                      std::string type = "JobError")
    -> std::unexpected<ErrorCause> {
  return std::unexpected{ErrorCause{std::move(type), std::move(message)}};
}

// What a running job sees of its task: identity, cancellation, progress
// reporting and suspension points.
class TaskContext {
public:
  using ProgressSink = std::function<void(double, std::string)>;

  TaskContext(TaskId id, CancellationToken token, ProgressSink sink = {})
      : id_(std::move(id)), token_(std::move(token)), sink_(std::move(sink)) {
  }

  [[nodiscard]] auto id() const noexcept -> const TaskId& {
    return id_;
  }
  [[nodiscard]] auto token() const noexcept -> const CancellationToken& {
    return token_;
  }
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return token_.is_cancelled();
  }

  auto report_progress(double value, std::string message = {}) -> void {
    if (sink_) {
      sink_(value, std::move(message));
    }
  }

  // Suspends on a carrier, blocks elsewhere. Yields false if cancelled.
  [[nodiscard]] auto sleep(std::chrono::milliseconds duration) -> task<bool>;

  class checkpoint_awaiter {
  public:
    explicit checkpoint_awaiter(const CancellationToken& token) noexcept
        : token_(token) {
    }
    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return !on_carrier() || token_.is_cancelled();
    }
    auto await_suspend(std::coroutine_handle<> handle) const noexcept
        -> void {
      yield_now().await_suspend(handle);
    }
    [[nodiscard]] auto await_resume() const noexcept -> bool {
      return !token_.is_cancelled();
    }

  private:
    const CancellationToken& token_;
  };

  // Lets other units run. Yields false if cancelled.
  [[nodiscard]] auto checkpoint() const noexcept -> checkpoint_awaiter {
    return checkpoint_awaiter{token_};
  }

  // Blocking sleep for synchronous bodies. Returns false if cancelled.
  auto wait_for(std::chrono::milliseconds duration) const -> bool {
    return !token_.wait_for(duration);
  }

private:
  TaskId id_;
  CancellationToken token_;
  ProgressSink sink_;
};

class IJob {
public:
  virtual ~IJob() = default;

  virtual auto run(TaskContext& ctx) -> JobResult = 0;

  // Cooperative entry point. The default runs the synchronous body on the
  // carrier thread without suspending.
  virtual auto run_async(TaskContext& ctx) -> task<JobResult>;
};

namespace detail {

template <typename R>
auto to_job_result(R&& value) -> JobResult {
  if constexpr (std::same_as<std::decay_t<R>, JobResult>) {
    return std::forward<R>(value);
  } else {
    return nlohmann::json(std::forward<R>(value));
  }
}

}  // namespace detail

template <typename F>
concept JobCallable = std::invocable<F&, TaskContext&>;

template <JobCallable F>
class FunctionJob final : public IJob {
public:
  explicit FunctionJob(F fn) : fn_(std::move(fn)) {
  }

  auto run(TaskContext& ctx) -> JobResult override {
    if constexpr (std::is_void_v<std::invoke_result_t<F&, TaskContext&>>) {
      std::invoke(fn_, ctx);
      return nlohmann::json(nullptr);
    } else {
      return detail::to_job_result(std::invoke(fn_, ctx));
    }
  }

private:
  F fn_;
};

template <typename F>
concept AsyncJobCallable =
    std::invocable<F&, TaskContext&> &&
    std::same_as<std::invoke_result_t<F&, TaskContext&>, task<JobResult>>;

template <AsyncJobCallable F>
class AsyncFunctionJob final : public IJob {
public:
  explicit AsyncFunctionJob(F fn) : fn_(std::move(fn)) {
  }

  auto run(TaskContext& ctx) -> JobResult override {
    return sync_wait(std::invoke(fn_, ctx));
  }

  auto run_async(TaskContext& ctx) -> task<JobResult> override {
    return std::invoke(fn_, ctx);
  }

private:
  F fn_;
};

template <JobCallable F>
[[nodiscard]] auto make_job(F fn) -> std::shared_ptr<IJob> {
  return std::make_shared<FunctionJob<F>>(std::move(fn));
}

// `fn` must return task<JobResult>. Lambda coroutines must not capture
// anything that dies before the job does.
template <AsyncJobCallable F>
[[nodiscard]] auto make_async_job(F fn) -> std::shared_ptr<IJob> {
  return std::make_shared<AsyncFunctionJob<F>>(std::move(fn));
}

}  // namespace taskcore
