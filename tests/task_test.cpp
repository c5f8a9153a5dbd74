#include "taskcore/task/task.hpp"
#include "taskcore/core/constants.hpp"

#include <chrono>
#include <cmath>
#include <limits>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskcore;
using taskcore::test::task_id;

TEST(TaskTest, DefaultsMatchRegistrationDefaults) {
  TaskSpec spec;
  EXPECT_FALSE(spec.id.has_value());
  EXPECT_EQ(spec.name, "Unnamed Task");
  EXPECT_EQ(spec.priority, TaskPriority::Normal);
  EXPECT_EQ(spec.max_retries, 0);
  EXPECT_DOUBLE_EQ(spec.retry_delay.count(), 1.0);
  EXPECT_FALSE(spec.timeout.has_value());
  EXPECT_TRUE(spec.metadata.is_object());
  EXPECT_FALSE(spec.executor.has_value());

  Task task;
  EXPECT_EQ(task.status, TaskStatus::Pending);
  EXPECT_EQ(task.retry_count, 0);
  EXPECT_DOUBLE_EQ(task.progress, 0.0);
  EXPECT_FALSE(task.started_at.has_value());
}

TEST(TaskTest, UpdateProgress_ClampsIntoUnitRange) {
  Task task;
  task.update_progress(-0.2, "below");
  EXPECT_DOUBLE_EQ(task.progress, 0.0);
  EXPECT_EQ(task.progress_message, "below");

  task.update_progress(1.5);
  EXPECT_DOUBLE_EQ(task.progress, 1.0);
  EXPECT_TRUE(task.progress_message.empty());

  task.update_progress(0.25, "quarter");
  EXPECT_DOUBLE_EQ(task.progress, 0.25);
}

TEST(TaskTest, UpdateProgress_NaNBecomesZero) {
  Task task;
  task.update_progress(0.7);
  task.update_progress(std::numeric_limits<double>::quiet_NaN());
  EXPECT_DOUBLE_EQ(task.progress, 0.0);
}

TEST(TaskTest, IsReady_RequiresEveryDependencyCompleted) {
  Task task;
  task.dependencies = {task_id("a"), task_id("b")};

  EXPECT_FALSE(task.is_ready({}));
  EXPECT_FALSE(task.is_ready({task_id("a")}));
  EXPECT_TRUE(task.is_ready({task_id("a"), task_id("b"), task_id("c")}));

  Task free;
  EXPECT_TRUE(free.is_ready({}));
}

TEST(TaskTest, RetryBackoff_DoublesPerAttempt) {
  Task task;
  task.retry_delay = Seconds{0.5};

  task.retry_count = 0;
  EXPECT_EQ(task.retry_backoff(), std::chrono::milliseconds(0));
  task.retry_count = 1;
  EXPECT_EQ(task.retry_backoff(), std::chrono::milliseconds(500));
  task.retry_count = 2;
  EXPECT_EQ(task.retry_backoff(), std::chrono::milliseconds(1000));
  task.retry_count = 3;
  EXPECT_EQ(task.retry_backoff(), std::chrono::milliseconds(2000));
}

TEST(TaskTest, RetryBackoff_SaturatesForLargeRetryCount) {
  Task task;
  task.retry_delay = Seconds{1.0};
  const auto cap =
      std::chrono::duration_cast<std::chrono::milliseconds>(timing::kMaxRetryBackoff);

  task.retry_count = 55;
  EXPECT_EQ(task.retry_backoff(), cap);
  task.retry_count = std::numeric_limits<int>::max();
  EXPECT_EQ(task.retry_backoff(), cap);

  task.retry_delay = Seconds{std::numeric_limits<double>::infinity()};
  task.retry_count = 1;
  EXPECT_EQ(task.retry_backoff(), cap);

  task.retry_delay = Seconds{std::nan("")};
  EXPECT_EQ(task.retry_backoff(), std::chrono::milliseconds(0));
}

TEST(TaskTest, ResultAndErrorAreExclusive) {
  Task task;
  task.set_error(task_errors::execution(task_id("t"), "boom"));
  ASSERT_TRUE(task.error.has_value());

  task.set_result(nlohmann::json{{"ok", true}});
  EXPECT_FALSE(task.error.has_value());
  ASSERT_TRUE(task.result.has_value());

  task.set_error(task_errors::execution(task_id("t"), "boom again"));
  EXPECT_FALSE(task.result.has_value());
}

TEST(TaskTest, ExecutionTime_NeedsBothTimestamps) {
  Task task;
  EXPECT_FALSE(task.execution_time().has_value());

  auto start = Task::clock::now();
  task.started_at = start;
  EXPECT_FALSE(task.execution_time().has_value());

  task.completed_at = start + std::chrono::milliseconds(1500);
  ASSERT_TRUE(task.execution_time().has_value());
  EXPECT_NEAR(task.execution_time()->count(), 1.5, 1e-9);
}

TEST(TaskTest, TerminalStatuses) {
  EXPECT_FALSE(is_terminal(TaskStatus::Pending));
  EXPECT_FALSE(is_terminal(TaskStatus::Waiting));
  EXPECT_FALSE(is_terminal(TaskStatus::Running));
  EXPECT_TRUE(is_terminal(TaskStatus::Completed));
  EXPECT_TRUE(is_terminal(TaskStatus::Failed));
  EXPECT_TRUE(is_terminal(TaskStatus::Cancelled));
}

TEST(TaskNamesTest, StatusAndPriority_RoundTripThroughNames) {
  EXPECT_EQ(to_string_view(TaskStatus::Waiting), "WAITING");
  EXPECT_EQ(to_string_view(TaskPriority::Critical), "CRITICAL");
  EXPECT_EQ(parse<TaskStatus>("CANCELLED"), TaskStatus::Cancelled);
  EXPECT_EQ(parse<TaskPriority>("LOW"), TaskPriority::Low);
  EXPECT_FALSE(parse<TaskStatus>("pending").has_value());
  EXPECT_FALSE(parse<TaskPriority>("URGENT").has_value());
}

TEST(TaskNamesTest, ExecutorTypeNames) {
  EXPECT_EQ(to_string_view(ExecutorType::ThreadPool), "thread_pool");
  EXPECT_EQ(parse<ExecutorType>("async"), ExecutorType::Async);
  EXPECT_EQ(parse<ExecutorType>("sequential"), ExecutorType::Sequential);
  EXPECT_FALSE(parse<ExecutorType>("process").has_value());
}

TEST(TaskJsonTest, SerializesEveryField) {
  Task task;
  task.id = task_id("t-1");
  task.name = "report";
  task.description = "nightly report";
  task.priority = TaskPriority::High;
  task.status = TaskStatus::Failed;
  task.executor = ExecutorType::ThreadPool;
  task.dependencies = {task_id("t-0")};
  task.tags = {"nightly", "report"};
  task.metadata = {{"owner", "ops"}};
  task.max_retries = 3;
  task.retry_count = 1;
  task.retry_delay = Seconds{2.0};
  task.timeout = std::chrono::milliseconds(1500);
  task.set_error(task_errors::timeout(task.id, std::chrono::milliseconds(1500)));

  nlohmann::json j = task;
  EXPECT_EQ(j["task_id"], "t-1");
  EXPECT_EQ(j["name"], "report");
  EXPECT_EQ(j["description"], "nightly report");
  EXPECT_EQ(j["priority"], "HIGH");
  EXPECT_EQ(j["status"], "FAILED");
  EXPECT_EQ(j["executor"], "thread_pool");
  EXPECT_EQ(j["dependencies"], nlohmann::json::array({"t-0"}));
  EXPECT_EQ(j["retry_count"], 1);
  EXPECT_EQ(j["max_retries"], 3);
  EXPECT_DOUBLE_EQ(j["retry_delay"].get<double>(), 2.0);
  EXPECT_DOUBLE_EQ(j["timeout"].get<double>(), 1.5);
  EXPECT_TRUE(j["started_at"].is_null());
  EXPECT_TRUE(j["completed_at"].is_null());
  EXPECT_TRUE(j["created_at"].get<std::string>().ends_with("Z"));
  EXPECT_EQ(j["tags"].size(), 2u);
  EXPECT_EQ(j["metadata"]["owner"], "ops");
  EXPECT_EQ(j["error"]["error_type"], "TaskTimeoutError");
}

TEST(TaskJsonTest, NoTimeoutSerializesAsNull) {
  Task task;
  task.id = task_id("t-2");
  nlohmann::json j = task;
  EXPECT_TRUE(j["timeout"].is_null());
  EXPECT_TRUE(j["error"].is_null());
}
