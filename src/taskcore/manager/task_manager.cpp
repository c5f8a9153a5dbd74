#include "taskcore/manager/task_manager.hpp"

#include "taskcore/core/constants.hpp"
#include "taskcore/util/log.hpp"
#include "taskcore/util/util.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <ranges>

namespace taskcore {

auto make_executors(const ManagerConfig& manager,
                    const ExecutorsConfig& executors) -> ExecutorSet {
  auto async_slots = executors.async_concurrency != 0
                         ? executors.async_concurrency
                         : static_cast<std::size_t>(manager.max_concurrent_tasks);
  ExecutorSet set;
  for (auto type : kAllExecutorTypes) {
    set.emplace(type, create_executor(type, executors.thread_pool_workers,
                                      async_slots, executors.carrier_threads));
  }
  return set;
}

auto to_json(nlohmann::json& j, const ManagerMetrics& m) -> void {
  nlohmann::json executors = nlohmann::json::object();
  for (auto type : kAllExecutorTypes) {
    if (auto it = m.executors.find(type); it != m.executors.end()) {
      executors[std::string(to_string_view(type))] = it->second;
    }
  }
  j = nlohmann::json{
      {"is_running", m.is_running},
      {"max_concurrent_tasks", m.max_concurrent_tasks},
      {"default_executor_type", to_string_view(m.default_executor)},
      {"total_tasks", m.total_tasks},
      {"pending_tasks", m.pending_tasks},
      {"waiting_tasks", m.waiting_tasks},
      {"running_tasks", m.running_tasks},
      {"completed_tasks", m.completed_tasks},
      {"failed_tasks", m.failed_tasks},
      {"cancelled_tasks", m.cancelled_tasks},
      {"executors", std::move(executors)},
  };
}

TaskManager::TaskManager(ManagerConfig config, ExecutorSet executors,
                         std::shared_ptr<IEventPublisher> publisher)
    : config_(std::move(config)),
      executors_(std::move(executors)),
      publisher_(publisher ? std::move(publisher)
                           : std::make_shared<NullEventPublisher>()),
      liveness_(std::make_shared<Liveness>()) {
  liveness_->self = this;
  if (!executors_.contains(config_.default_executor)) {
    log::warn("Default executor {} not configured",
              to_string_view(config_.default_executor));
  }
  log::info("Task manager initialized with {} max concurrent tasks",
            config_.max_concurrent_tasks);
}

TaskManager::~TaskManager() {
  shutdown(false);
  std::unique_lock lock(liveness_->mu);
  liveness_->self = nullptr;
  liveness_->drained.wait(lock, [this] { return liveness_->active == 0; });
}

auto TaskManager::create(const SystemConfig& config,
                         std::shared_ptr<IEventPublisher> publisher)
    -> std::unique_ptr<TaskManager> {
  return std::make_unique<TaskManager>(
      config.manager, make_executors(config.manager, config.executors),
      std::move(publisher));
}

auto TaskManager::find_locked(const TaskId& id) -> Entry* {
  auto it = tasks_.find(id);
  return it == tasks_.end() ? nullptr : &it->second;
}

auto TaskManager::find_locked(const TaskId& id) const -> const Entry* {
  auto it = tasks_.find(id);
  return it == tasks_.end() ? nullptr : &it->second;
}

auto TaskManager::set_status_locked(Entry& entry, TaskStatus status) -> void {
  const auto& id = entry.task.id;
  auto set_for = [this](TaskStatus s) -> std::unordered_set<TaskId>* {
    switch (s) {
      case TaskStatus::Running:
        return &running_ids_;
      case TaskStatus::Completed:
        return &completed_ids_;
      case TaskStatus::Failed:
        return &failed_ids_;
      case TaskStatus::Cancelled:
        return &cancelled_ids_;
      case TaskStatus::Waiting:
        return &waiting_ids_;
      case TaskStatus::Pending:
        return nullptr;
    }
    return nullptr;
  };

  if (auto* from = set_for(entry.task.status)) {
    from->erase(id);
  }
  if (auto* to = set_for(status)) {
    to->insert(id);
  }
  entry.task.status = status;
  state_cv_.notify_all();
}

auto TaskManager::deps_met_locked(const Task& task) const -> bool {
  return task.is_ready(completed_ids_);
}

auto TaskManager::register_task(TaskSpec spec) -> TaskResult<TaskId> {
  auto requested = spec.id.value_or(TaskId{});
  if (spec.name.empty()) {
    return std::unexpected{
        task_errors::invalid_argument(requested, "Task name must not be empty")};
  }
  if (!spec.job) {
    return std::unexpected{
        task_errors::invalid_argument(requested, "Task has no job")};
  }
  if (spec.max_retries < 0) {
    return std::unexpected{task_errors::invalid_argument(
        requested, "max_retries must not be negative")};
  }
  if (!std::isfinite(spec.retry_delay.count())) {
    return std::unexpected{task_errors::invalid_argument(
        requested, "retry_delay must be finite")};
  }
  if (spec.retry_delay < Seconds::zero()) {
    return std::unexpected{task_errors::invalid_argument(
        requested, "retry_delay must not be negative")};
  }
  if (spec.timeout && *spec.timeout <= std::chrono::milliseconds::zero()) {
    return std::unexpected{
        task_errors::invalid_argument(requested, "timeout must be positive")};
  }
  if (spec.timeout && *spec.timeout > timing::kMaxTaskTimeout) {
    return std::unexpected{task_errors::invalid_argument(
        requested, std::format("timeout must not exceed {}",
                               timing::kMaxTaskTimeout))};
  }

  auto executor = config_.default_executor;
  if (spec.executor) {
    if (auto parsed = parse<ExecutorType>(*spec.executor);
        parsed && executors_.contains(*parsed)) {
      executor = *parsed;
    } else {
      log::warn("Executor type {} not found, using default {}", *spec.executor,
                to_string_view(config_.default_executor));
    }
  }

  EventBatch events;
  TaskId id;
  {
    std::lock_guard lock(mu_);

    id = requested.empty() ? TaskId{generate_uuid()} : requested;
    if (tasks_.contains(id)) {
      auto fresh = TaskId{generate_uuid()};
      log::warn("Task ID {} already exists, using {}", id, fresh);
      id = std::move(fresh);
    }

    std::vector<TaskId> deps;
    deps.reserve(spec.dependencies.size());
    for (auto& dep : spec.dependencies) {
      if (!tasks_.contains(dep)) {
        log::error("Task {} depends on unknown task {}", id, dep);
        return std::unexpected{task_errors::dependency(id, dep)};
      }
      if (std::ranges::find(deps, dep) == deps.end()) {
        deps.push_back(std::move(dep));
      }
    }

    Task task{
        .id = id,
        .name = std::move(spec.name),
        .description = std::move(spec.description),
        .tags = std::move(spec.tags),
        .metadata = std::move(spec.metadata),
        .priority = spec.priority,
        .executor = executor,
        .dependencies = std::move(deps),
        .max_retries = spec.max_retries,
        .retry_delay = spec.retry_delay,
        .timeout = spec.timeout,
        .job = std::move(spec.job),
    };

    auto [it, inserted] =
        tasks_.emplace(id, Entry{.task = std::move(task), .seq = next_seq_++});
    order_.push_back(id);
    auto& entry = it->second;
    if (!entry.task.dependencies.empty() && !deps_met_locked(entry.task)) {
      set_status_locked(entry, TaskStatus::Waiting);
    }

    nlohmann::json payload{
        {"task_id", id},
        {"name", entry.task.name},
        {"priority", to_string_view(entry.task.priority)},
        {"dependencies", entry.task.dependencies},
        {"executor_type", to_string_view(entry.task.executor)},
    };
    events.push_back({EventType::TaskCreated, id, std::move(payload)});
    log::info("Task registered: {} ({})", id, entry.task.name);
  }
  loop_cv_.notify_one();
  publish(std::move(events));
  return id;
}

auto TaskManager::get_task(const TaskId& id) const -> std::optional<Task> {
  std::lock_guard lock(mu_);
  if (auto* entry = find_locked(id)) {
    return entry->task;
  }
  return std::nullopt;
}

auto TaskManager::get_status(const TaskId& id) const
    -> std::optional<TaskStatus> {
  std::lock_guard lock(mu_);
  if (auto* entry = find_locked(id)) {
    return entry->task.status;
  }
  return std::nullopt;
}

auto TaskManager::get_result(const TaskId& id) const
    -> std::optional<nlohmann::json> {
  std::lock_guard lock(mu_);
  if (auto* entry = find_locked(id)) {
    return entry->task.result;
  }
  return std::nullopt;
}

auto TaskManager::get_error(const TaskId& id) const
    -> std::optional<TaskError> {
  std::lock_guard lock(mu_);
  if (auto* entry = find_locked(id)) {
    return entry->task.error;
  }
  return std::nullopt;
}

auto TaskManager::get_progress(const TaskId& id) const
    -> std::optional<std::pair<double, std::string>> {
  std::lock_guard lock(mu_);
  if (auto* entry = find_locked(id)) {
    return std::pair{entry->task.progress, entry->task.progress_message};
  }
  return std::nullopt;
}

auto TaskManager::update_progress(const TaskId& id, double value,
                                  std::string message) -> bool {
  EventBatch events;
  {
    std::lock_guard lock(mu_);
    auto* entry = find_locked(id);
    if (!entry) {
      return false;
    }
    entry->task.update_progress(value, std::move(message));
    events.push_back({EventType::TaskProgress, id,
                      nlohmann::json{
                          {"task_id", id},
                          {"name", entry->task.name},
                          {"progress", entry->task.progress},
                          {"progress_message", entry->task.progress_message},
                      }});
  }
  publish(std::move(events));
  return true;
}

auto TaskManager::collect_locked(auto&& pred) const -> std::vector<Task> {
  std::vector<Task> out;
  for (const auto& id : order_) {
    const auto& task = tasks_.at(id).task;
    if (pred(task)) {
      out.push_back(task);
    }
  }
  return out;
}

auto TaskManager::tasks_by_status(TaskStatus status) const
    -> std::vector<Task> {
  std::lock_guard lock(mu_);
  return collect_locked(
      [status](const Task& t) { return t.status == status; });
}

auto TaskManager::tasks_by_tag(std::string_view tag) const
    -> std::vector<Task> {
  std::lock_guard lock(mu_);
  return collect_locked([tag](const Task& t) {
    return std::ranges::any_of(t.tags, [tag](const auto& s) { return s == tag; });
  });
}

auto TaskManager::tasks_by_metadata(std::string_view key,
                                    const nlohmann::json& value) const
    -> std::vector<Task> {
  std::lock_guard lock(mu_);
  return collect_locked([&](const Task& t) {
    if (!t.metadata.is_object()) {
      return false;
    }
    auto it = t.metadata.find(key);
    return it != t.metadata.end() && *it == value;
  });
}

auto TaskManager::list_tasks() const -> std::vector<Task> {
  std::lock_guard lock(mu_);
  return collect_locked([](const Task&) { return true; });
}

auto TaskManager::task_json(const TaskId& id) const
    -> std::optional<nlohmann::json> {
  std::lock_guard lock(mu_);
  if (auto* entry = find_locked(id)) {
    return nlohmann::json(entry->task);
  }
  return std::nullopt;
}

auto TaskManager::promote_waiting_locked(EventBatch&) -> void {
  std::vector<TaskId> ready;
  for (const auto& id : waiting_ids_) {
    if (deps_met_locked(tasks_.at(id).task)) {
      ready.push_back(id);
    }
  }
  for (const auto& id : ready) {
    log::debug("Task {} dependencies satisfied, now PENDING", id);
    set_status_locked(tasks_.at(id), TaskStatus::Pending);
  }
}

auto TaskManager::promote_due_retries_locked(SteadyClock::time_point now)
    -> void {
  while (!retry_schedule_.empty() && retry_schedule_.begin()->first <= now) {
    auto id = retry_schedule_.begin()->second;
    retry_schedule_.erase(retry_schedule_.begin());
    auto* entry = find_locked(id);
    if (entry && entry->task.status == TaskStatus::Running &&
        !entry->in_flight) {
      set_status_locked(*entry, TaskStatus::Pending);
    }
  }
}

auto TaskManager::claim_locked(Entry& entry, EventBatch& events) -> Dispatch {
  auto& task = entry.task;
  set_status_locked(entry, TaskStatus::Running);
  task.started_at = Task::clock::now();
  entry.in_flight = true;
  ++entry.attempt;

  events.push_back({EventType::TaskStarted, task.id,
                    nlohmann::json{
                        {"task_id", task.id},
                        {"name", task.name},
                        {"executor_type", to_string_view(task.executor)},
                    }});
  log::info("Task started: {} ({})", task.id, task.name);

  auto it = executors_.find(task.executor);
  auto sink = [liveness = liveness_, id = task.id](double value,
                                                   std::string message) {
    liveness->with_manager([&](TaskManager& manager) {
      manager.update_progress(id, value, std::move(message));
    });
  };
  return Dispatch{
      .id = task.id,
      .attempt = entry.attempt,
      .executor = it == executors_.end() ? nullptr : it->second.get(),
      .request = ExecutionRequest{.id = task.id,
                                  .job = task.job,
                                  .timeout = task.timeout,
                                  .progress = std::move(sink)},
  };
}

auto TaskManager::dispatch(Dispatch d) -> void {
  if (d.executor == nullptr) {
    on_attempt_finished(d.id, d.attempt,
                        std::unexpected{task_errors::execution(
                            d.id, "No executor available for task")});
    return;
  }
  d.executor->start(
      std::move(d.request),
      [liveness = liveness_, id = d.id,
       attempt = d.attempt](ExecutionOutcome outcome) {
        liveness->with_manager([&](TaskManager& manager) {
          manager.on_attempt_finished(id, attempt, std::move(outcome));
        });
      });
}

auto TaskManager::finalize_cancelled_locked(Entry& entry,
                                            std::string_view reason,
                                            EventBatch& events) -> void {
  auto& task = entry.task;
  entry.in_flight = false;
  std::erase_if(retry_schedule_,
                [&](const auto& kv) { return kv.second == task.id; });
  task.set_error(task_errors::cancelled(task.id, reason));
  task.completed_at = Task::clock::now();
  set_status_locked(entry, TaskStatus::Cancelled);
  events.push_back({EventType::TaskCancelled, task.id,
                    nlohmann::json{
                        {"task_id", task.id},
                        {"name", task.name},
                        {"reason", reason},
                    }});
  log::info("Task cancelled: {} ({})", task.id, task.name);
}

auto TaskManager::on_attempt_finished(const TaskId& id, std::uint32_t attempt,
                                      ExecutionOutcome outcome) -> void {
  EventBatch events;
  {
    std::lock_guard lock(mu_);
    auto* entry = find_locked(id);
    if (!entry || entry->attempt != attempt || !entry->in_flight ||
        entry->task.status != TaskStatus::Running) {
      log::debug("Discarding stale outcome for task {}", id);
      return;
    }
    auto& task = entry->task;
    entry->in_flight = false;

    if (outcome) {
      task.completed_at = Task::clock::now();
      task.set_result(std::move(*outcome));
      task.update_progress(1.0, "Task completed");
      set_status_locked(*entry, TaskStatus::Completed);
      events.push_back(
          {EventType::TaskCompleted, id,
           nlohmann::json{
               {"task_id", id},
               {"name", task.name},
               {"execution_time", task.execution_time().value_or(Seconds{}).count()},
           }});
      log::info("Task completed: {} ({})", id, task.name);
      promote_waiting_locked(events);
    } else if (outcome.error().is_cancellation()) {
      auto reason = outcome.error().details.value("reason", "cancelled");
      finalize_cancelled_locked(*entry, reason, events);
    } else if (task.retry_count < task.max_retries) {
      ++task.retry_count;
      auto backoff = task.retry_backoff();
      log::warn("Task {} ({}) failed: {}. Retrying in {} ({}/{})", id,
                task.name, outcome.error().message, backoff, task.retry_count,
                task.max_retries);
      task.set_error(std::move(outcome.error()));
      retry_schedule_.emplace(SteadyClock::now() + backoff, id);
      state_cv_.notify_all();
    } else {
      task.completed_at = Task::clock::now();
      task.set_error(std::move(outcome.error()));
      set_status_locked(*entry, TaskStatus::Failed);
      events.push_back({EventType::TaskFailed, id,
                        nlohmann::json{
                            {"task_id", id},
                            {"name", task.name},
                            {"error", task.error->message},
                        }});
      log::error("Task failed: {} ({}): {}", id, task.name,
                 task.error->message);
    }
  }
  loop_cv_.notify_one();
  publish(std::move(events));
}

auto TaskManager::terminal_outcome_locked(const Entry& entry) const
    -> TaskResult<nlohmann::json> {
  const auto& task = entry.task;
  if (task.status == TaskStatus::Completed) {
    return task.result.value_or(nlohmann::json(nullptr));
  }
  if (task.error) {
    return std::unexpected{*task.error};
  }
  return std::unexpected{task.status == TaskStatus::Cancelled
                             ? task_errors::cancelled(task.id, "cancelled")
                             : task_errors::execution(task.id, "Task failed")};
}

auto TaskManager::execute(const TaskId& id, bool wait)
    -> TaskResult<nlohmann::json> {
  std::unique_lock lock(mu_);
  auto* entry = find_locked(id);
  if (!entry) {
    return std::unexpected{task_errors::not_found(id)};
  }
  auto status = entry->task.status;
  if (status != TaskStatus::Pending && status != TaskStatus::Waiting) {
    return std::unexpected{task_errors::invalid_state(
        id, to_string_view(status), "execute")};
  }

  if (!wait) {
    if (!deps_met_locked(entry->task)) {
      if (status != TaskStatus::Waiting) {
        set_status_locked(*entry, TaskStatus::Waiting);
      }
      return nlohmann::json(nullptr);
    }
    EventBatch events;
    auto d = claim_locked(*entry, events);
    lock.unlock();
    publish(std::move(events));
    dispatch(std::move(d));
    return nlohmann::json(nullptr);
  }

  while (true) {
    entry = find_locked(id);
    auto& task = entry->task;

    if (task.is_terminal()) {
      return terminal_outcome_locked(*entry);
    }

    if (task.status == TaskStatus::Pending ||
        task.status == TaskStatus::Waiting) {
      if (!deps_met_locked(task)) {
        for (const auto& dep : task.dependencies) {
          auto dep_status = tasks_.at(dep).task.status;
          if (dep_status == TaskStatus::Failed ||
              dep_status == TaskStatus::Cancelled) {
            auto err = task_errors::dependency(id, dep);
            err.message = std::format("Dependency {} is {}", dep,
                                      to_string_view(dep_status));
            return std::unexpected{std::move(err)};
          }
        }
        if (task.status != TaskStatus::Waiting) {
          set_status_locked(*entry, TaskStatus::Waiting);
        }
        state_cv_.wait_for(lock, config_.dependency_poll_interval);
        continue;
      }

      EventBatch events;
      auto d = claim_locked(*entry, events);
      lock.unlock();
      publish(std::move(events));
      dispatch(std::move(d));
      lock.lock();
      continue;
    }

    // RUNNING: either an attempt is in flight or the task is in backoff.
    if (!entry->in_flight) {
      auto now = SteadyClock::now();
      auto it = std::ranges::find_if(
          retry_schedule_, [&](const auto& kv) { return kv.second == id; });
      if (it != retry_schedule_.end()) {
        if (it->first <= now) {
          retry_schedule_.erase(it);
          set_status_locked(*entry, TaskStatus::Pending);
          continue;
        }
        state_cv_.wait_until(lock, it->first);
        continue;
      }
    }
    state_cv_.wait_for(lock, config_.dependency_poll_interval);
  }
}

auto TaskManager::cancel(const TaskId& id) -> bool {
  EventBatch events;
  IExecutor* executor = nullptr;
  {
    std::lock_guard lock(mu_);
    auto* entry = find_locked(id);
    if (!entry) {
      log::warn("Task {} not found for cancellation", id);
      return false;
    }

    switch (entry->task.status) {
      case TaskStatus::Pending:
      case TaskStatus::Waiting:
        finalize_cancelled_locked(*entry, "cancelled by user", events);
        break;
      case TaskStatus::Running:
        if (!entry->in_flight) {
          // in retry backoff, nothing to interrupt
          finalize_cancelled_locked(*entry, "cancelled by user", events);
        } else if (auto it = executors_.find(entry->task.executor);
                   it != executors_.end()) {
          executor = it->second.get();
        }
        break;
      default:
        log::warn("Cannot cancel task {} with status {}", id,
                  to_string_view(entry->task.status));
        return false;
    }
  }

  if (!events.empty()) {
    loop_cv_.notify_one();
    publish(std::move(events));
    return true;
  }
  if (executor == nullptr) {
    return false;
  }

  // A successful executor cancel settles the attempt as Cancelled, which
  // finalizes the task through on_attempt_finished before cancel() returns.
  if (!executor->cancel(id)) {
    log::warn("{}", task_errors::cancellation_failed(
                        id, "executor could not interrupt the running unit")
                        .message);
    return false;
  }
  return get_status(id) == TaskStatus::Cancelled;
}

auto TaskManager::start() -> void {
  std::lock_guard lock(mu_);
  if (running_.load()) {
    log::warn("Task manager is already running");
    return;
  }
  if (shut_down_) {
    log::warn("Task manager has been shut down");
    return;
  }
  stop_requested_ = false;
  running_.store(true, std::memory_order_release);
  loop_thread_ = std::thread([this] { run_loop(); });
  log::info("Task manager started");
}

auto TaskManager::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (!running_.load()) {
      return;
    }
    stop_requested_ = true;
  }
  loop_cv_.notify_all();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  running_.store(false, std::memory_order_release);
  log::info("Task manager stopped");
}

auto TaskManager::shutdown(bool wait) -> void {
  {
    std::lock_guard lock(mu_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    stop_requested_ = true;
  }
  loop_cv_.notify_all();
  // Sequential bodies dispatched by the loop run on the loop thread, so they
  // have to be interrupted before it can be joined.
  cancel_running(ExecutorType::Sequential);
  stop();
  cancel_running(std::nullopt);

  for (auto& [type, executor] : executors_) {
    if (executor) {
      executor->shutdown(wait);
    }
  }
  log::info("Task manager shut down");
}

auto TaskManager::cancel_running(std::optional<ExecutorType> only) -> void {
  std::vector<TaskId> ids;
  {
    std::lock_guard lock(mu_);
    for (const auto& id : running_ids_) {
      const auto* entry = find_locked(id);
      if (entry && (!only || entry->task.executor == *only)) {
        ids.push_back(id);
      }
    }
  }
  for (const auto& id : ids) {
    (void)cancel(id);
  }
}

auto TaskManager::release_claim(const Dispatch& d) -> void {
  std::lock_guard lock(mu_);
  auto* entry = find_locked(d.id);
  if (!entry || entry->attempt != d.attempt || !entry->in_flight) {
    return;
  }
  entry->in_flight = false;
  entry->task.started_at.reset();
  set_status_locked(*entry, TaskStatus::Pending);
  log::debug("Task {} returned to pending, loop stopping", d.id);
}

auto TaskManager::run_loop() -> void {
  log::debug("Scheduler loop running, tick {}", config_.tick_interval);
  std::unique_lock lock(mu_);
  while (!stop_requested_) {
    lock.unlock();
    tick();
    lock.lock();
    if (stop_requested_) {
      break;
    }
    loop_cv_.wait_for(lock, config_.tick_interval);
  }
}

auto TaskManager::tick() -> void {
  EventBatch events;
  std::vector<Dispatch> batch;
  {
    std::lock_guard lock(mu_);
    promote_waiting_locked(events);
    promote_due_retries_locked(SteadyClock::now());

    auto capacity = config_.max_concurrent_tasks -
                    static_cast<int>(running_ids_.size());
    if (capacity > 0) {
      std::vector<Entry*> candidates;
      for (auto& [id, entry] : tasks_) {
        if (entry.task.status == TaskStatus::Pending) {
          candidates.push_back(&entry);
        }
      }
      std::ranges::sort(candidates, [](const Entry* a, const Entry* b) {
        if (a->task.priority != b->task.priority) {
          return a->task.priority > b->task.priority;
        }
        return a->seq < b->seq;
      });
      for (auto* entry : candidates | std::views::take(capacity)) {
        batch.push_back(claim_locked(*entry, events));
      }
    }
  }

  publish(std::move(events));
  for (auto& d : batch) {
    bool stopping = false;
    {
      std::lock_guard lock(mu_);
      stopping = stop_requested_;
    }
    if (stopping) {
      release_claim(d);
    } else {
      dispatch(std::move(d));
    }
  }
}

auto TaskManager::publish(EventBatch events) -> void {
  for (auto& ev : events) {
    try {
      auto published = publisher_->publish(ev.type, ev.task_id, ev.payload);
      if (!published) {
        log::warn("Failed to publish {} event for task {}: {}",
                  to_string_view(ev.type), ev.task_id,
                  published.error().message());
      }
    } catch (const std::exception& e) {
      log::warn("Failed to publish {} event for task {}: {}",
                to_string_view(ev.type), ev.task_id, e.what());
    }
  }
}

auto TaskManager::metrics() const -> ManagerMetrics {
  ManagerMetrics m;
  {
    std::lock_guard lock(mu_);
    m.is_running = running_.load();
    m.max_concurrent_tasks = config_.max_concurrent_tasks;
    m.default_executor = config_.default_executor;
    m.total_tasks = tasks_.size();
    m.pending_tasks = static_cast<std::size_t>(
        std::ranges::count_if(tasks_, [](const auto& kv) {
          return kv.second.task.status == TaskStatus::Pending;
        }));
    m.waiting_tasks = waiting_ids_.size();
    m.running_tasks = running_ids_.size();
    m.completed_tasks = completed_ids_.size();
    m.failed_tasks = failed_ids_.size();
    m.cancelled_tasks = cancelled_ids_.size();
  }
  for (const auto& [type, executor] : executors_) {
    if (executor) {
      m.executors.emplace(type, executor->metrics());
    }
  }
  return m;
}

}  // namespace taskcore
