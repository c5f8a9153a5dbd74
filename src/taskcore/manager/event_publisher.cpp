#include "taskcore/manager/event_publisher.hpp"

#include "taskcore/util/log.hpp"

namespace taskcore {

auto LoggingEventPublisher::publish(EventType type, const TaskId& task_id,
                                    const nlohmann::json& payload)
    -> Result<void> {
  log::debug("event {} task={} {}", to_string_view(type), task_id,
             payload.dump());
  return ok();
}

}  // namespace taskcore
