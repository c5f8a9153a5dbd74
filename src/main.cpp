#include "taskcore/config/config.hpp"
#include "taskcore/manager/event_publisher.hpp"
#include "taskcore/manager/task_manager.hpp"
#include "taskcore/task/job.hpp"
#include "taskcore/util/log.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("taskcore - in-process task orchestration engine");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Runs a demonstration workload through the task manager and");
  std::println("prints the final metrics snapshot as JSON.");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   YAML config file");
  std::println("  --log-level <level>   trace, debug, info, warn, error, off");
  std::println(
      "  --executor <type>     Default executor: sequential, thread_pool, "
      "async");
  std::println("  --tasks <n>           Number of cooperative tasks (default: 8)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("taskcore v0.1.0");
}

struct Options {
  std::string config_file;
  std::optional<std::string> log_level;
  std::optional<taskcore::ExecutorType> executor;
  int cooperative_tasks = 8;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string_view {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--log-level") {
      auto value = require_value(i, argc, argv, arg);
      if (!taskcore::log::parse_level(value)) {
        std::println(stderr, "Error: unknown log level: {}", value);
        std::exit(1);
      }
      opts.log_level = std::string(value);
    } else if (arg == "--executor") {
      auto value = require_value(i, argc, argv, arg);
      opts.executor = taskcore::parse<taskcore::ExecutorType>(value);
      if (!opts.executor) {
        std::println(stderr, "Error: unknown executor type: {}", value);
        std::exit(1);
      }
    } else if (arg == "--tasks") {
      auto value = require_value(i, argc, argv, arg);
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                       opts.cooperative_tasks);
      if (ec != std::errc{} || ptr != value.data() + value.size() ||
          opts.cooperative_tasks < 0) {
        std::println(stderr, "Error: --tasks expects a non-negative integer");
        std::exit(1);
      }
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto load_config(const Options& opts)
    -> std::optional<taskcore::SystemConfig> {
  taskcore::SystemConfig config;
  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return std::nullopt;
    }
    auto loaded = taskcore::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config: {}",
                   loaded.error().message());
      return std::nullopt;
    }
    config = std::move(*loaded);
  }
  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }
  if (opts.executor) {
    config.manager.default_executor = *opts.executor;
  }
  return config;
}

// Registers the demonstration workload and returns the ids it created.
auto register_demo(taskcore::TaskManager& manager, int cooperative_tasks)
    -> std::vector<taskcore::TaskId> {
  using taskcore::JobResult;
  using taskcore::TaskContext;
  using taskcore::TaskPriority;
  using taskcore::TaskSpec;

  std::vector<taskcore::TaskId> ids;
  auto add = [&](TaskSpec spec) -> std::optional<taskcore::TaskId> {
    auto name = spec.name;
    auto id = manager.register_task(std::move(spec));
    if (!id) {
      taskcore::log::error("Failed to register {}: {}", name,
                           id.error().message);
      return std::nullopt;
    }
    ids.push_back(*id);
    return *id;
  };

  // extract -> transform -> load
  auto extract = add(TaskSpec{
      .name = "extract",
      .description = "Produce the input records",
      .job = taskcore::make_job([](TaskContext& ctx) -> JobResult {
        for (int step = 1; step <= 4; ++step) {
          if (!ctx.wait_for(25ms)) {
            return taskcore::job_failure("interrupted");
          }
          ctx.report_progress(step / 4.0, std::format("batch {}/4", step));
        }
        return nlohmann::json{{"records", 128}};
      }),
      .priority = TaskPriority::High,
      .tags = {"pipeline"},
      .executor = "thread_pool",
  });
  std::optional<taskcore::TaskId> transform;
  if (extract) {
    transform = add(TaskSpec{
        .name = "transform",
        .job = taskcore::make_job([](TaskContext& ctx) -> JobResult {
          (void)ctx.wait_for(50ms);
          return nlohmann::json{{"records", 120}, {"dropped", 8}};
        }),
        .dependencies = {*extract},
        .tags = {"pipeline"},
    });
  }
  if (transform) {
    add(TaskSpec{
        .name = "load",
        .job = taskcore::make_job(
            [](TaskContext&) { return nlohmann::json{{"written", 120}}; }),
        .dependencies = {*transform},
        .tags = {"pipeline"},
        .executor = "sequential",
    });
  }

  // Fails on its first two attempts.
  auto attempts = std::make_shared<std::atomic<int>>(0);
  add(TaskSpec{
      .name = "flaky",
      .job = taskcore::make_job([attempts](TaskContext&) -> JobResult {
        auto n = attempts->fetch_add(1) + 1;
        if (n < 3) {
          return taskcore::job_failure(
              std::format("transient failure on attempt {}", n),
              "ConnectionError");
        }
        return nlohmann::json{{"attempts", n}};
      }),
      .max_retries = 2,
      .retry_delay = taskcore::Seconds{0.05},
      .tags = {"retry"},
  });

  // First attempt overruns its timeout, the retry is quick.
  auto slow_once = std::make_shared<std::atomic<bool>>(true);
  add(TaskSpec{
      .name = "deadline",
      .job = taskcore::make_job([slow_once](TaskContext& ctx) -> JobResult {
        if (slow_once->exchange(false)) {
          (void)ctx.wait_for(500ms);
        }
        return nlohmann::json("done");
      }),
      .max_retries = 1,
      .retry_delay = taskcore::Seconds{0.05},
      .timeout = 100ms,
      .tags = {"timeout"},
      .executor = "thread_pool",
  });

  for (int i = 0; i < cooperative_tasks; ++i) {
    add(TaskSpec{
        .name = std::format("cooperative-{}", i),
        .job = taskcore::make_async_job(
            [i](TaskContext& ctx) -> taskcore::task<JobResult> {
              for (int step = 1; step <= 5; ++step) {
                if (!co_await ctx.sleep(10ms)) {
                  co_return taskcore::job_failure("cancelled mid-flight");
                }
                ctx.report_progress(step / 5.0);
              }
              co_return nlohmann::json{{"index", i}};
            }),
        .priority = i % 2 == 0 ? TaskPriority::Normal : TaskPriority::Low,
        .metadata = {{"batch", i / 4}},
        .executor = "async",
    });
  }
  return ids;
}

auto all_terminal(const taskcore::TaskManager& manager,
                  const std::vector<taskcore::TaskId>& ids) -> bool {
  for (const auto& id : ids) {
    auto status = manager.get_status(id);
    if (status && !taskcore::is_terminal(*status)) {
      return false;
    }
  }
  return true;
}

auto run(const Options& opts) -> int {
  auto config = load_config(opts);
  if (!config) {
    return 1;
  }
  if (auto valid = taskcore::ConfigLoader::validate(*config); !valid) {
    std::println(stderr, "Error: Invalid config: {}", valid.error().message());
    return 1;
  }

  taskcore::log::set_level(config->logging.level);
  taskcore::log::start();

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto manager = taskcore::TaskManager::create(
      *config, std::make_shared<taskcore::LoggingEventPublisher>());
  auto ids = register_demo(*manager, opts.cooperative_tasks);

  taskcore::log::info("taskcore starting with {} tasks...", ids.size());
  manager->start();

  while (!all_terminal(*manager, ids) &&
         !g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(100ms);
  }

  if (g_shutdown_requested.load(std::memory_order_acquire)) {
    taskcore::log::info("Received shutdown signal, stopping...");
  }

  manager->shutdown(!g_shutdown_requested.load(std::memory_order_acquire));
  auto metrics = manager->metrics();
  std::println("{}", nlohmann::json(metrics).dump(2));

  for (const auto& task :
       manager->tasks_by_status(taskcore::TaskStatus::Failed)) {
    taskcore::log::error("Task {} failed: {}", task.name,
                         task.error ? task.error->message : "unknown error");
  }

  taskcore::log::info("taskcore stopped.");
  taskcore::log::stop();
  return metrics.failed_tasks == 0 ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  return run(opts);
}
