#pragma once

#include "taskcore/config/system_config.hpp"
#include "taskcore/executor/executor.hpp"
#include "taskcore/manager/event_publisher.hpp"
#include "taskcore/task/task.hpp"
#include "taskcore/task/task_error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace taskcore {

using ExecutorSet = std::unordered_map<ExecutorType, std::unique_ptr<IExecutor>>;

// One executor per strategy, sized from the configuration.
[[nodiscard]] auto make_executors(const ManagerConfig& manager,
                                  const ExecutorsConfig& executors)
    -> ExecutorSet;

struct ManagerMetrics {
  bool is_running{false};
  int max_concurrent_tasks{0};
  ExecutorType default_executor{ExecutorType::Async};
  std::size_t total_tasks{0};
  std::size_t pending_tasks{0};
  std::size_t waiting_tasks{0};
  std::size_t running_tasks{0};
  std::size_t completed_tasks{0};
  std::size_t failed_tasks{0};
  std::size_t cancelled_tasks{0};
  std::unordered_map<ExecutorType, ExecutorMetrics> executors;
};

auto to_json(nlohmann::json& j, const ManagerMetrics& m) -> void;

// Owns every registered task, resolves dependencies and drives attempts
// through the executors. A background loop promotes and dispatches tasks
// every tick; execute(id, true) drives a single task from the caller.
//
// All state sits behind one mutex that is never held while a body runs or
// while events are published.
class TaskManager {
public:
  TaskManager(ManagerConfig config, ExecutorSet executors,
              std::shared_ptr<IEventPublisher> publisher = nullptr);
  ~TaskManager();

  TaskManager(const TaskManager&) = delete;
  TaskManager& operator=(const TaskManager&) = delete;

  [[nodiscard]] static auto create(
      const SystemConfig& config,
      std::shared_ptr<IEventPublisher> publisher = nullptr)
      -> std::unique_ptr<TaskManager>;

  [[nodiscard]] auto register_task(TaskSpec spec) -> TaskResult<TaskId>;

  [[nodiscard]] auto get_task(const TaskId& id) const -> std::optional<Task>;
  [[nodiscard]] auto get_status(const TaskId& id) const
      -> std::optional<TaskStatus>;
  [[nodiscard]] auto get_result(const TaskId& id) const
      -> std::optional<nlohmann::json>;
  [[nodiscard]] auto get_error(const TaskId& id) const
      -> std::optional<TaskError>;
  [[nodiscard]] auto get_progress(const TaskId& id) const
      -> std::optional<std::pair<double, std::string>>;

  auto update_progress(const TaskId& id, double value, std::string message = {})
      -> bool;

  [[nodiscard]] auto tasks_by_status(TaskStatus status) const
      -> std::vector<Task>;
  [[nodiscard]] auto tasks_by_tag(std::string_view tag) const
      -> std::vector<Task>;
  [[nodiscard]] auto tasks_by_metadata(std::string_view key,
                                       const nlohmann::json& value) const
      -> std::vector<Task>;
  [[nodiscard]] auto list_tasks() const -> std::vector<Task>;
  [[nodiscard]] auto task_json(const TaskId& id) const
      -> std::optional<nlohmann::json>;

  // wait=false returns null immediately once the task is dispatched or parked
  // as WAITING. wait=true blocks until the task is terminal.
  auto execute(const TaskId& id, bool wait = true) -> TaskResult<nlohmann::json>;

  auto cancel(const TaskId& id) -> bool;

  auto start() -> void;
  auto stop() -> void;
  auto shutdown(bool wait = true) -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto metrics() const -> ManagerMetrics;
  [[nodiscard]] auto config() const noexcept -> const ManagerConfig& {
    return config_;
  }

private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    Task task;
    std::uint64_t seq{0};
    std::uint32_t attempt{0};
    bool in_flight{false};
  };

  struct PendingEvent {
    EventType type;
    TaskId task_id;
    nlohmann::json payload;
  };
  using EventBatch = std::vector<PendingEvent>;

  struct Dispatch {
    TaskId id;
    std::uint32_t attempt{0};
    IExecutor* executor{nullptr};
    ExecutionRequest request;
  };

  // Outlives the manager so late callbacks from abandoned bodies can tell
  // it is gone. `mu` guards only the pointer and the in-flight count; the
  // call itself runs unlocked and the destructor waits for it to drain.
  struct Liveness {
    std::mutex mu;
    std::condition_variable drained;
    TaskManager* self{nullptr};
    std::size_t active{0};

    template <typename F>
    auto with_manager(F&& fn) -> void {
      TaskManager* manager = nullptr;
      {
        std::lock_guard lock(mu);
        if (self == nullptr) {
          return;
        }
        manager = self;
        ++active;
      }
      struct Release {
        Liveness& owner;
        ~Release() {
          std::lock_guard lock(owner.mu);
          if (--owner.active == 0) {
            owner.drained.notify_all();
          }
        }
      } release{*this};
      std::forward<F>(fn)(*manager);
    }
  };

  auto run_loop() -> void;
  auto tick() -> void;

  auto find_locked(const TaskId& id) -> Entry*;
  auto find_locked(const TaskId& id) const -> const Entry*;
  auto set_status_locked(Entry& entry, TaskStatus status) -> void;
  auto deps_met_locked(const Task& task) const -> bool;
  auto promote_waiting_locked(EventBatch& events) -> void;
  auto promote_due_retries_locked(SteadyClock::time_point now) -> void;
  auto claim_locked(Entry& entry, EventBatch& events) -> Dispatch;
  auto finalize_cancelled_locked(Entry& entry, std::string_view reason,
                                 EventBatch& events) -> void;
  auto on_attempt_finished(const TaskId& id, std::uint32_t attempt,
                           ExecutionOutcome outcome) -> void;
  auto terminal_outcome_locked(const Entry& entry) const
      -> TaskResult<nlohmann::json>;
  auto collect_locked(auto&& pred) const -> std::vector<Task>;

  auto dispatch(Dispatch d) -> void;
  auto release_claim(const Dispatch& d) -> void;
  auto cancel_running(std::optional<ExecutorType> only) -> void;
  auto publish(EventBatch events) -> void;

  ManagerConfig config_;
  ExecutorSet executors_;
  std::shared_ptr<IEventPublisher> publisher_;
  std::shared_ptr<Liveness> liveness_;

  mutable std::mutex mu_;
  std::condition_variable state_cv_;
  std::condition_variable loop_cv_;
  std::unordered_map<TaskId, Entry> tasks_;
  std::vector<TaskId> order_;
  std::uint64_t next_seq_{0};
  std::unordered_set<TaskId> running_ids_;
  std::unordered_set<TaskId> completed_ids_;
  std::unordered_set<TaskId> failed_ids_;
  std::unordered_set<TaskId> cancelled_ids_;
  std::unordered_set<TaskId> waiting_ids_;
  std::multimap<SteadyClock::time_point, TaskId> retry_schedule_;

  std::atomic<bool> running_{false};
  bool stop_requested_{false};
  bool shut_down_{false};
  std::thread loop_thread_;
};

}  // namespace taskcore
