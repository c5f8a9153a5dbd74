#pragma once

#include "taskcore/core/error.hpp"
#include "taskcore/util/id.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace taskcore {

// Underlying failure that produced an execution error.
struct ErrorCause {
  std::string type;
  std::string message;
};

// Structured failure for task operations. `code` selects the taxonomy name
// reported as error_type.
struct TaskError {
  Error code{Error::Unknown};
  TaskId task_id;
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  std::optional<ErrorCause> cause;

  [[nodiscard]] auto is_cancellation() const noexcept -> bool {
    return code == Error::Cancelled;
  }
  [[nodiscard]] auto is_timeout() const noexcept -> bool {
    return code == Error::TaskTimeout;
  }
  [[nodiscard]] auto error_code() const -> std::error_code {
    return make_error_code(code);
  }
};

template <typename T>
using TaskResult = std::expected<T, TaskError>;

[[nodiscard]] auto error_type_name(Error code) noexcept -> std::string_view;

auto to_json(nlohmann::json& j, const TaskError& e) -> void;

namespace task_errors {

[[nodiscard]] auto dependency(const TaskId& id, const TaskId& missing)
    -> TaskError;
[[nodiscard]] auto not_found(const TaskId& id) -> TaskError;
[[nodiscard]] auto invalid_state(const TaskId& id, std::string_view current,
                                 std::string_view operation) -> TaskError;
[[nodiscard]] auto invalid_argument(const TaskId& id, std::string message)
    -> TaskError;
[[nodiscard]] auto execution(const TaskId& id, std::string message,
                             std::optional<ErrorCause> cause = std::nullopt)
    -> TaskError;
[[nodiscard]] auto timeout(const TaskId& id,
                           std::chrono::milliseconds limit) -> TaskError;
[[nodiscard]] auto cancellation_failed(const TaskId& id,
                                       std::string_view reason) -> TaskError;
[[nodiscard]] auto cancelled(const TaskId& id, std::string_view reason)
    -> TaskError;

}  // namespace task_errors

}  // namespace taskcore
