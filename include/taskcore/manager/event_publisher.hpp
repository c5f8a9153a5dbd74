#pragma once

#include "taskcore/core/error.hpp"
#include "taskcore/util/id.hpp"
#include "taskcore/util/names.hpp"

#include <array>
#include <cstdint>
#include <string_view>

#include <nlohmann/json.hpp>

namespace taskcore {

enum class EventType : std::uint8_t {
  TaskCreated,
  TaskStarted,
  TaskProgress,
  TaskCompleted,
  TaskFailed,
  TaskCancelled,
};

template <>
struct enum_names<EventType> {
  static constexpr std::array<std::string_view, 6> values = {
      "TASK_CREATED",   "TASK_STARTED", "TASK_PROGRESS",
      "TASK_COMPLETED", "TASK_FAILED",  "TASK_CANCELLED",
  };
};

// Sink for task lifecycle notifications. The manager calls publish() outside
// its lock; an error return or a thrown exception is logged and dropped.
class IEventPublisher {
public:
  virtual ~IEventPublisher() = default;

  virtual auto publish(EventType type, const TaskId& task_id,
                       const nlohmann::json& payload) -> Result<void> = 0;
};

class NullEventPublisher final : public IEventPublisher {
public:
  auto publish(EventType, const TaskId&, const nlohmann::json&)
      -> Result<void> override {
    return ok();
  }
};

// Writes every event to the log at debug level.
class LoggingEventPublisher final : public IEventPublisher {
public:
  auto publish(EventType type, const TaskId& task_id,
               const nlohmann::json& payload) -> Result<void> override;
};

}  // namespace taskcore
