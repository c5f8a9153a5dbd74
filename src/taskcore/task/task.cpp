#include "taskcore/task/task.hpp"

#include "taskcore/core/constants.hpp"
#include "taskcore/util/util.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>

namespace taskcore {

auto Task::update_progress(double value, std::string message) -> void {
  if (std::isnan(value)) {
    value = 0.0;
  }
  progress = std::clamp(value, 0.0, 1.0);
  progress_message = std::move(message);
}

auto Task::is_ready(const std::unordered_set<TaskId>& completed) const
    -> bool {
  return std::ranges::all_of(dependencies, [&](const TaskId& dep) {
    return completed.contains(dep);
  });
}

auto Task::retry_backoff() const -> std::chrono::milliseconds {
  if (retry_count <= 0 || !(retry_delay > Seconds::zero())) {
    return std::chrono::milliseconds::zero();
  }
  constexpr Seconds cap = timing::kMaxRetryBackoff;
  // 2^40 seconds is far past the cap, so the exponent stops growing there.
  auto factor = std::ldexp(1.0, std::min(retry_count - 1, 40));
  auto backoff = retry_delay * factor;
  if (!(backoff < cap)) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(cap);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(backoff);
}

auto Task::set_result(nlohmann::json value) -> void {
  result = std::move(value);
  error.reset();
}

auto Task::set_error(TaskError err) -> void {
  error = std::move(err);
  result.reset();
}

auto Task::execution_time() const -> std::optional<Seconds> {
  if (!started_at || !completed_at) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<Seconds>(*completed_at - *started_at);
}

namespace {

auto timestamp_or_null(const std::optional<Task::clock::time_point>& tp)
    -> nlohmann::json {
  if (!tp) {
    return nullptr;
  }
  return format_timestamp(*tp);
}

}  // namespace

auto to_json(nlohmann::json& j, const Task& task) -> void {
  j = nlohmann::json{
      {"task_id", task.id},
      {"name", task.name},
      {"description", task.description},
      {"priority", to_string_view(task.priority)},
      {"status", to_string_view(task.status)},
      {"executor", to_string_view(task.executor)},
      {"dependencies", task.dependencies},
      {"created_at", format_timestamp(task.created_at)},
      {"started_at", timestamp_or_null(task.started_at)},
      {"completed_at", timestamp_or_null(task.completed_at)},
      {"retry_count", task.retry_count},
      {"max_retries", task.max_retries},
      {"retry_delay", task.retry_delay.count()},
      {"timeout", task.timeout ? nlohmann::json(task.timeout->count() / 1000.0)
                               : nlohmann::json(nullptr)},
      {"progress", task.progress},
      {"progress_message", task.progress_message},
      {"tags", task.tags},
      {"metadata", task.metadata},
      {"error", task.error ? nlohmann::json(*task.error)
                           : nlohmann::json(nullptr)},
  };
}

}  // namespace taskcore
