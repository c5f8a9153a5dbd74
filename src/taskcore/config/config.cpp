#include "taskcore/config/config.hpp"

#include "taskcore/config/yaml_utils.hpp"
#include "taskcore/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskcore::LoggingConfig> {
  static bool decode(const Node& node, taskcore::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = taskcore::yaml_get_or<std::string>(node, "level", "info");
    return true;
  }
};

template <>
struct convert<taskcore::ManagerConfig> {
  static bool decode(const Node& node, taskcore::ManagerConfig& m) {
    if (!node.IsMap()) {
      return false;
    }
    taskcore::ManagerConfig defaults;
    m.max_concurrent_tasks = taskcore::yaml_get_or(
        node, "max_concurrent_tasks", defaults.max_concurrent_tasks);
    m.default_executor = taskcore::yaml_get_or(node, "default_executor",
                                               defaults.default_executor);
    m.tick_interval =
        taskcore::yaml_get_ms(node, "tick_interval_ms", defaults.tick_interval);
    m.dependency_poll_interval = taskcore::yaml_get_ms(
        node, "dependency_poll_interval_ms", defaults.dependency_poll_interval);
    return true;
  }
};

template <>
struct convert<taskcore::ExecutorsConfig> {
  static bool decode(const Node& node, taskcore::ExecutorsConfig& e) {
    if (!node.IsMap()) {
      return false;
    }
    taskcore::ExecutorsConfig defaults;
    e.thread_pool_workers = taskcore::yaml_get_or(
        node, "thread_pool_workers", defaults.thread_pool_workers);
    e.async_concurrency = taskcore::yaml_get_or(node, "async_concurrency",
                                                defaults.async_concurrency);
    e.carrier_threads = taskcore::yaml_get_or(node, "carrier_threads",
                                              defaults.carrier_threads);
    return true;
  }
};

template <>
struct convert<taskcore::SystemConfig> {
  static bool decode(const Node& node, taskcore::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<taskcore::LoggingConfig>();
    }
    if (auto manager = node["manager"]) {
      c.manager = manager.as<taskcore::ManagerConfig>();
    }
    if (auto executors = node["executors"]) {
      c.executors = executors.as<taskcore::ExecutorsConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskcore {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::BadConversion& e) {
    log::error("Invalid config value: {}", e.what());
    return fail(Error::InvalidArgument);
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto valid = validate(config); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  if (!log::parse_level(config.logging.level)) {
    log::error("Unknown log level: {}", config.logging.level);
    return fail(Error::InvalidArgument);
  }
  if (config.manager.max_concurrent_tasks < 1) {
    log::error("manager.max_concurrent_tasks must be at least 1, got {}",
               config.manager.max_concurrent_tasks);
    return fail(Error::InvalidArgument);
  }
  if (config.manager.tick_interval < std::chrono::milliseconds(1)) {
    log::error("manager.tick_interval_ms must be at least 1, got {}",
               config.manager.tick_interval.count());
    return fail(Error::InvalidArgument);
  }
  if (config.manager.dependency_poll_interval < std::chrono::milliseconds(1)) {
    log::error("manager.dependency_poll_interval_ms must be at least 1, got {}",
               config.manager.dependency_poll_interval.count());
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace taskcore
