#pragma once

#include "taskcore/core/constants.hpp"
#include "taskcore/executor/executor_type.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace taskcore {

struct LoggingConfig {
  std::string level{"info"};
};

struct ManagerConfig {
  int max_concurrent_tasks{limits::kDefaultMaxConcurrentTasks};
  ExecutorType default_executor{ExecutorType::Async};
  std::chrono::milliseconds tick_interval{timing::kSchedulerTick};
  std::chrono::milliseconds dependency_poll_interval{
      timing::kDependencyPollInterval};
};

struct ExecutorsConfig {
  std::size_t thread_pool_workers{0};  // 0 = host core count
  std::size_t async_concurrency{0};    // 0 = max_concurrent_tasks
  unsigned carrier_threads{limits::kDefaultCarrierThreads};
};

struct SystemConfig {
  LoggingConfig logging;
  ManagerConfig manager;
  ExecutorsConfig executors;
};

}  // namespace taskcore
