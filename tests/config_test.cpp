#include "taskcore/config/config.hpp"

#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace taskcore;
using namespace std::chrono_literals;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.logging.level, "info");
  EXPECT_EQ(config.manager.max_concurrent_tasks, 4);
  EXPECT_EQ(config.manager.default_executor, ExecutorType::Async);
  EXPECT_EQ(config.manager.tick_interval, 100ms);
  EXPECT_EQ(config.manager.dependency_poll_interval, 100ms);
  EXPECT_EQ(config.executors.thread_pool_workers, 0u);
  EXPECT_EQ(config.executors.async_concurrency, 0u);
  EXPECT_EQ(config.executors.carrier_threads, 2u);
  EXPECT_TRUE(ConfigLoader::validate(config).has_value());
}

TEST(ConfigTest, LoadFromString_FullDocument) {
  auto result = ConfigLoader::load_from_string(R"(
logging:
  level: debug
manager:
  max_concurrent_tasks: 8
  default_executor: thread_pool
  tick_interval_ms: 20
  dependency_poll_interval_ms: 50
executors:
  thread_pool_workers: 6
  async_concurrency: 32
  carrier_threads: 3
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();

  const auto& c = *result;
  EXPECT_EQ(c.logging.level, "debug");
  EXPECT_EQ(c.manager.max_concurrent_tasks, 8);
  EXPECT_EQ(c.manager.default_executor, ExecutorType::ThreadPool);
  EXPECT_EQ(c.manager.tick_interval, 20ms);
  EXPECT_EQ(c.manager.dependency_poll_interval, 50ms);
  EXPECT_EQ(c.executors.thread_pool_workers, 6u);
  EXPECT_EQ(c.executors.async_concurrency, 32u);
  EXPECT_EQ(c.executors.carrier_threads, 3u);
}

TEST(ConfigTest, LoadFromString_MissingKeysTakeDefaults) {
  auto result = ConfigLoader::load_from_string(R"(
manager:
  default_executor: sequential
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->manager.default_executor, ExecutorType::Sequential);
  EXPECT_EQ(result->manager.max_concurrent_tasks, 4);
  EXPECT_EQ(result->logging.level, "info");
  EXPECT_EQ(result->executors.carrier_threads, 2u);
}

TEST(ConfigTest, LoadFromString_MalformedYaml_ParseError) {
  auto result = ConfigLoader::load_from_string("manager: [unclosed");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_Empty_ParseError) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromString_UnknownExecutor_InvalidArgument) {
  auto result = ConfigLoader::load_from_string(R"(
manager:
  default_executor: process_pool
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, LoadFromString_ZeroCeiling_InvalidArgument) {
  auto result = ConfigLoader::load_from_string(R"(
manager:
  max_concurrent_tasks: 0
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, LoadFromString_ZeroTick_InvalidArgument) {
  auto result = ConfigLoader::load_from_string(R"(
manager:
  tick_interval_ms: 0
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, Validate_RejectsUnknownLogLevel) {
  SystemConfig config;
  config.logging.level = "verbose";
  auto valid = ConfigLoader::validate(config);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), Error::InvalidArgument);
}

TEST(ConfigTest, LoadFromFile_Missing_FileNotFound) {
  auto result =
      ConfigLoader::load_from_file("/nonexistent/taskcore/config.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::FileNotFound);
}

TEST(ConfigTest, LoadFromFile_ReadsDocument) {
  auto path = std::filesystem::temp_directory_path() / "taskcore_config_test.yaml";
  {
    std::ofstream out(path);
    out << "logging:\n  level: warn\nmanager:\n  max_concurrent_tasks: 2\n";
  }

  auto result = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, "warn");
  EXPECT_EQ(result->manager.max_concurrent_tasks, 2);
}
