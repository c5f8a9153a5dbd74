#include "taskcore/executor/executor.hpp"

#include "taskcore/util/log.hpp"

#include <future>
#include <memory>
#include <utility>

namespace taskcore {

auto to_json(nlohmann::json& j, const ExecutorMetrics& m) -> void {
  j = m.extra;
  j["executor_type"] = to_string_view(m.type);
  j["active"] = m.active;
  j["capacity"] = m.capacity;
  j["is_idle"] = m.idle;
}

auto IExecutor::execute(ExecutionRequest request) -> ExecutionOutcome {
  auto promise = std::make_shared<std::promise<ExecutionOutcome>>();
  auto future = promise->get_future();
  start(std::move(request), [promise](ExecutionOutcome outcome) {
    promise->set_value(std::move(outcome));
  });
  return future.get();
}

auto create_executor(ExecutorType type, std::size_t workers,
                     std::size_t max_concurrency, unsigned carrier_threads)
    -> std::unique_ptr<IExecutor> {
  switch (type) {
    case ExecutorType::Sequential:
      return create_sequential_executor();
    case ExecutorType::ThreadPool:
      return create_worker_pool_executor(workers);
    case ExecutorType::Async:
      return create_cooperative_executor(max_concurrency, carrier_threads);
  }
  log::error("Unknown executor type {}", std::to_underlying(type));
  return nullptr;
}

}  // namespace taskcore
