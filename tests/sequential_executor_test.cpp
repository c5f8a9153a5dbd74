#include "taskcore/executor/sequential_executor.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskcore;
using namespace std::chrono_literals;
using taskcore::test::task_id;

namespace {

auto request(std::string_view id, std::shared_ptr<IJob> job,
             std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    -> ExecutionRequest {
  return ExecutionRequest{.id = task_id(id), .job = std::move(job),
                          .timeout = timeout};
}

}  // namespace

TEST(SequentialExecutorTest, Execute_ReturnsJobValue) {
  SequentialExecutor executor;
  auto outcome = executor.execute(request("t", test::value_job({{"x", 1}})));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ((*outcome)["x"], 1);
}

TEST(SequentialExecutorTest, Start_RunsOnCallingThread) {
  SequentialExecutor executor;
  auto caller = std::this_thread::get_id();
  std::thread::id ran_on;
  std::optional<ExecutionOutcome> seen;

  executor.start(request("t", make_job([&](TaskContext&) {
                           ran_on = std::this_thread::get_id();
                         })),
                 [&](ExecutionOutcome o) { seen = std::move(o); });

  // The callback has already run by the time start() returns.
  ASSERT_TRUE(seen.has_value());
  EXPECT_TRUE(seen->has_value());
  EXPECT_EQ(ran_on, caller);
}

TEST(SequentialExecutorTest, ReturnedFailure_WrappedAsExecutionError) {
  SequentialExecutor executor;
  auto outcome = executor.execute(request(
      "t", make_job([](TaskContext&) -> JobResult {
        return job_failure("disk full", "IOError");
      })));
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code, Error::TaskExecution);
  EXPECT_EQ(outcome.error().message, "Task t failed: disk full");
  ASSERT_TRUE(outcome.error().cause.has_value());
  EXPECT_EQ(outcome.error().cause->type, "IOError");
}

TEST(SequentialExecutorTest, ThrownException_WrappedAsExecutionError) {
  SequentialExecutor executor;
  auto outcome = executor.execute(
      request("t", make_job([](TaskContext&) -> JobResult {
        throw std::runtime_error("exploded");
      })));
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code, Error::TaskExecution);
  ASSERT_TRUE(outcome.error().cause.has_value());
  EXPECT_EQ(outcome.error().cause->message, "exploded");
}

TEST(SequentialExecutorTest, Timeout_ReportsTimeoutError) {
  SequentialExecutor executor;
  auto start = std::chrono::steady_clock::now();
  auto outcome =
      executor.execute(request("slow", test::sleeping_job(500ms), 50ms));
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code, Error::TaskTimeout);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);
}

TEST(SequentialExecutorTest, TimeoutNotReached_ReturnsValue) {
  SequentialExecutor executor;
  auto outcome = executor.execute(request("quick", test::value_job(5), 1s));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, 5);
}

TEST(SequentialExecutorTest, Cancel_OnlyCurrentTaskSucceeds) {
  SequentialExecutor executor;
  test::Gate started;
  std::optional<ExecutionOutcome> seen;

  std::thread runner([&] {
    executor.start(
        request("long", make_job([&](TaskContext& ctx) -> JobResult {
                  started.open();
                  (void)ctx.wait_for(5s);
                  return nlohmann::json("finished");
                })),
        [&](ExecutionOutcome o) { seen = std::move(o); });
  });

  ASSERT_TRUE(started.wait_for(2s));
  EXPECT_FALSE(executor.cancel(task_id("other")));
  EXPECT_TRUE(executor.cancel(task_id("long")));
  runner.join();

  ASSERT_TRUE(seen.has_value());
  ASSERT_FALSE(seen->has_value());
  EXPECT_TRUE(seen->error().is_cancellation());
}

TEST(SequentialExecutorTest, Cancel_NothingRunning_ReturnsFalse) {
  SequentialExecutor executor;
  EXPECT_FALSE(executor.cancel(task_id("t")));
}

TEST(SequentialExecutorTest, CancelDuringDeadlineWait_WakesCaller) {
  SequentialExecutor executor;
  test::Gate started;
  std::optional<ExecutionOutcome> seen;

  std::thread runner([&] {
    executor.start(request("long", make_job([&](TaskContext& ctx) -> JobResult {
                             started.open();
                             (void)ctx.wait_for(5s);
                             return nlohmann::json(nullptr);
                           }),
                           10s),
                   [&](ExecutionOutcome o) { seen = std::move(o); });
  });

  ASSERT_TRUE(started.wait_for(2s));
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(executor.cancel(task_id("long")));
  runner.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  ASSERT_TRUE(seen.has_value());
  EXPECT_TRUE(seen->error().is_cancellation());
}

TEST(SequentialExecutorTest, AfterShutdown_RejectsWork) {
  SequentialExecutor executor;
  executor.shutdown(true);
  auto outcome = executor.execute(request("t", test::value_job(1)));
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code, Error::TaskExecution);
}

TEST(SequentialExecutorTest, Metrics) {
  SequentialExecutor executor;
  auto m = executor.metrics();
  EXPECT_EQ(m.type, ExecutorType::Sequential);
  EXPECT_EQ(m.capacity, 1u);
  EXPECT_EQ(m.active, 0u);
  EXPECT_TRUE(m.idle);

  nlohmann::json j = m;
  EXPECT_EQ(j["executor_type"], "sequential");
  EXPECT_TRUE(j["running_task"].is_null());
  EXPECT_EQ(j["is_idle"], true);
}
