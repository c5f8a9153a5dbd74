#include "taskcore/task/task_error.hpp"

#include <format>

namespace taskcore {

auto error_type_name(Error code) noexcept -> std::string_view {
  switch (code) {
    case Error::TaskDependency:
      return "TaskDependencyError";
    case Error::TaskNotFound:
      return "TaskNotFoundError";
    case Error::InvalidTaskState:
      return "InvalidTaskStateError";
    case Error::TaskExecution:
      return "TaskExecutionError";
    case Error::TaskTimeout:
      return "TaskTimeoutError";
    case Error::TaskCancellation:
      return "TaskCancellationError";
    case Error::Cancelled:
      return "CancelledError";
    case Error::InvalidArgument:
      return "InvalidArgumentError";
    default:
      return "TaskError";
  }
}

auto to_json(nlohmann::json& j, const TaskError& e) -> void {
  j = nlohmann::json{
      {"error_type", error_type_name(e.code)},
      {"message", e.message},
      {"task_id", e.task_id.empty() ? nlohmann::json(nullptr)
                                    : nlohmann::json(e.task_id)},
      {"details", e.details},
  };
  if (e.cause) {
    j["original_error"] = {{"type", e.cause->type},
                           {"message", e.cause->message}};
  }
}

namespace task_errors {

auto dependency(const TaskId& id, const TaskId& missing) -> TaskError {
  return TaskError{
      .code = Error::TaskDependency,
      .task_id = id,
      .message = std::format("Dependency {} not found", missing),
      .details = {{"dependency_id", missing.str()}},
  };
}

auto not_found(const TaskId& id) -> TaskError {
  return TaskError{
      .code = Error::TaskNotFound,
      .task_id = id,
      .message = std::format("Task {} not found", id),
  };
}

auto invalid_state(const TaskId& id, std::string_view current,
                   std::string_view operation) -> TaskError {
  return TaskError{
      .code = Error::InvalidTaskState,
      .task_id = id,
      .message = std::format("Task {} is in state {}, cannot {}", id, current,
                             operation),
      .details = {{"current_status", current}, {"operation", operation}},
  };
}

auto invalid_argument(const TaskId& id, std::string message) -> TaskError {
  return TaskError{
      .code = Error::InvalidArgument,
      .task_id = id,
      .message = std::move(message),
  };
}

auto execution(const TaskId& id, std::string message,
               std::optional<ErrorCause> cause) -> TaskError {
  return TaskError{
      .code = Error::TaskExecution,
      .task_id = id,
      .message = std::move(message),
      .cause = std::move(cause),
  };
}

auto timeout(const TaskId& id, std::chrono::milliseconds limit) -> TaskError {
  return TaskError{
      .code = Error::TaskTimeout,
      .task_id = id,
      .message = std::format("Task {} timed out after {}", id, limit),
      .details = {{"timeout_ms", limit.count()}},
  };
}

auto cancellation_failed(const TaskId& id, std::string_view reason)
    -> TaskError {
  return TaskError{
      .code = Error::TaskCancellation,
      .task_id = id,
      .message = std::format("Failed to cancel task {}: {}", id, reason),
  };
}

auto cancelled(const TaskId& id, std::string_view reason) -> TaskError {
  return TaskError{
      .code = Error::Cancelled,
      .task_id = id,
      .message = "Task was cancelled",
      .details = {{"reason", reason}},
  };
}

}  // namespace task_errors

}  // namespace taskcore
