#pragma once

#include "taskcore/executor/executor_type.hpp"
#include "taskcore/task/job.hpp"
#include "taskcore/task/task_error.hpp"
#include "taskcore/util/id.hpp"
#include "taskcore/util/names.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace taskcore {

enum class TaskPriority : std::uint8_t {
  Low,
  Normal,
  High,
  Critical,
};

enum class TaskStatus : std::uint8_t {
  Pending,
  Waiting,
  Running,
  Completed,
  Failed,
  Cancelled,
};

template <>
struct enum_names<TaskPriority> {
  static constexpr std::array<std::string_view, 4> values = {
      "LOW",
      "NORMAL",
      "HIGH",
      "CRITICAL",
  };
};

template <>
struct enum_names<TaskStatus> {
  static constexpr std::array<std::string_view, 6> values = {
      "PENDING",
      "WAITING",
      "RUNNING",
      "COMPLETED",
      "FAILED",
      "CANCELLED",
  };
};

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Completed || status == TaskStatus::Failed ||
         status == TaskStatus::Cancelled;
}

using Seconds = std::chrono::duration<double>;

// Registration request. Unset id means one is generated; unset executor
// means the manager's default.
struct TaskSpec {
  std::optional<TaskId> id;
  std::string name{"Unnamed Task"};
  std::string description;
  std::shared_ptr<IJob> job;
  TaskPriority priority{TaskPriority::Normal};
  std::vector<TaskId> dependencies;
  int max_retries{0};
  Seconds retry_delay{1.0};
  std::optional<std::chrono::milliseconds> timeout;
  std::set<std::string> tags;
  nlohmann::json metadata = nlohmann::json::object();
  std::optional<std::string> executor;
};

struct Task {
  using clock = std::chrono::system_clock;

  TaskId id;
  std::string name;
  std::string description;
  std::set<std::string> tags;
  nlohmann::json metadata = nlohmann::json::object();

  TaskPriority priority{TaskPriority::Normal};
  TaskStatus status{TaskStatus::Pending};
  ExecutorType executor{ExecutorType::Async};
  std::vector<TaskId> dependencies;

  int max_retries{0};
  Seconds retry_delay{1.0};
  int retry_count{0};
  std::optional<std::chrono::milliseconds> timeout;

  double progress{0.0};
  std::string progress_message;

  std::optional<nlohmann::json> result;
  std::optional<TaskError> error;

  clock::time_point created_at{clock::now()};
  std::optional<clock::time_point> started_at;
  std::optional<clock::time_point> completed_at;

  std::shared_ptr<IJob> job;

  // Clamps into [0, 1]; NaN becomes 0.
  auto update_progress(double value, std::string message = {}) -> void;

  [[nodiscard]] auto is_ready(
      const std::unordered_set<TaskId>& completed) const -> bool;

  [[nodiscard]] auto is_terminal() const noexcept -> bool {
    return taskcore::is_terminal(status);
  }

  // Backoff before the current retry: retry_delay * 2^(retry_count - 1).
  [[nodiscard]] auto retry_backoff() const -> std::chrono::milliseconds;

  auto set_result(nlohmann::json value) -> void;
  auto set_error(TaskError err) -> void;

  [[nodiscard]] auto execution_time() const -> std::optional<Seconds>;
};

auto to_json(nlohmann::json& j, const Task& task) -> void;

}  // namespace taskcore
