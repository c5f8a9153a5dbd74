#include "taskcore/executor/deadline_timer.hpp"
#include "taskcore/executor/worker_pool_executor.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <thread>
#include <vector>

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

TEST(WorkerPoolExecutorTest, ZeroWorkers_UsesHostCores) {
  WorkerPoolExecutor executor(0);
  EXPECT_GE(executor.worker_count(), 1u);
}

TEST(WorkerPoolExecutorTest, Execute_RunsOnWorkerThread) {
  WorkerPoolExecutor executor(2);
  auto caller = std::this_thread::get_id();
  std::atomic<bool> other_thread{false};

  auto outcome = executor.execute(request("t", make_job([&](TaskContext&) {
    other_thread = std::this_thread::get_id() != caller;
    return 42;
  })));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, 42);
  EXPECT_TRUE(other_thread.load());
}

TEST(WorkerPoolExecutorTest, RunsUnitsInParallel) {
  WorkerPoolExecutor executor(4);
  test::BlockingQueue<ExecutionOutcome> outcomes;

  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 4; ++i) {
    executor.start(request(std::format("t{}", i), test::sleeping_job(100ms)),
                   [&](ExecutionOutcome o) { outcomes.push(std::move(o)); });
  }
  for (int i = 0; i < 4; ++i) {
    auto o = outcomes.try_pop_for(2s);
    ASSERT_TRUE(o.has_value());
    EXPECT_TRUE(o->has_value());
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, 350ms);
}

TEST(WorkerPoolExecutorTest, Cancel_QueuedUnitSucceeds) {
  WorkerPoolExecutor executor(1);
  test::Gate release;
  test::Gate blocker_started;
  test::BlockingQueue<std::pair<std::string, ExecutionOutcome>> outcomes;

  executor.start(request("blocker", make_job([&](TaskContext&) {
                           blocker_started.open();
                           (void)release.wait_for(5s);
                         })),
                 [&](ExecutionOutcome o) {
                   outcomes.push({"blocker", std::move(o)});
                 });
  ASSERT_TRUE(blocker_started.wait_for(2s));

  std::atomic<bool> queued_ran{false};
  executor.start(request("queued", make_job([&](TaskContext&) {
                           queued_ran = true;
                         })),
                 [&](ExecutionOutcome o) {
                   outcomes.push({"queued", std::move(o)});
                 });

  EXPECT_TRUE(executor.cancel(task_id("queued")));
  auto first = outcomes.try_pop_for(1s);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->first, "queued");
  EXPECT_TRUE(first->second.error().is_cancellation());

  // Running units cannot be cancelled.
  EXPECT_FALSE(executor.cancel(task_id("blocker")));
  release.open();
  auto second = outcomes.try_pop_for(2s);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->first, "blocker");
  EXPECT_TRUE(second->second.has_value());
  EXPECT_FALSE(queued_ran.load());
}

TEST(WorkerPoolExecutorTest, Timeout_AbandonsBody) {
  WorkerPoolExecutor executor(2);
  auto start = std::chrono::steady_clock::now();
  auto outcome = executor.execute(request("slow", test::sleeping_job(1s), 50ms));
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code, Error::TaskTimeout);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
}

TEST(WorkerPoolExecutorTest, SameTaskId_CanRunAgainAfterTimeout) {
  WorkerPoolExecutor executor(2);
  auto first = executor.execute(request("t", test::sleeping_job(300ms), 20ms));
  ASSERT_FALSE(first.has_value());

  auto second = executor.execute(request("t", test::value_job("retry")));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, "retry");
}

TEST(WorkerPoolExecutorTest, ShutdownWithoutWait_CancelsQueued) {
  auto executor = std::make_unique<WorkerPoolExecutor>(1);
  test::Gate blocker_started;
  test::BlockingQueue<ExecutionOutcome> outcomes;

  executor->start(request("blocker", make_job([&](TaskContext& ctx) {
                            blocker_started.open();
                            (void)ctx.wait_for(5s);
                          })),
                  [&](ExecutionOutcome o) { outcomes.push(std::move(o)); });
  ASSERT_TRUE(blocker_started.wait_for(2s));
  executor->start(request("queued", test::value_job(1)),
                  [&](ExecutionOutcome o) { outcomes.push(std::move(o)); });

  executor->shutdown(false);

  int cancelled = 0;
  for (int i = 0; i < 2; ++i) {
    auto o = outcomes.try_pop_for(2s);
    ASSERT_TRUE(o.has_value());
    if (!o->has_value() && o->error().is_cancellation()) {
      ++cancelled;
    }
  }
  EXPECT_GE(cancelled, 1);

  auto rejected = executor->execute(request("late", test::value_job(1)));
  EXPECT_FALSE(rejected.has_value());
}

TEST(WorkerPoolExecutorTest, Metrics) {
  WorkerPoolExecutor executor(3);
  auto m = executor.metrics();
  EXPECT_EQ(m.type, ExecutorType::ThreadPool);
  EXPECT_EQ(m.capacity, 3u);
  EXPECT_TRUE(m.idle);

  nlohmann::json j = m;
  EXPECT_EQ(j["executor_type"], "thread_pool");
  EXPECT_EQ(j["max_workers"], 3);
  EXPECT_EQ(j["active_workers"], 0);
  EXPECT_EQ(j["queued"], 0);
}

TEST(DeadlineTimerTest, FiresInDeadlineOrder) {
  DeadlineTimer timer;
  test::BlockingQueue<int> fired;

  timer.schedule(60ms, [&] { fired.push(2); });
  timer.schedule(20ms, [&] { fired.push(1); });

  EXPECT_EQ(fired.try_pop_for(1s), 1);
  EXPECT_EQ(fired.try_pop_for(1s), 2);
  EXPECT_EQ(timer.pending(), 0u);
}

TEST(DeadlineTimerTest, CancelledTimerNeverFires) {
  DeadlineTimer timer;
  std::atomic<bool> fired{false};

  auto id = timer.schedule(30ms, [&] { fired = true; });
  EXPECT_TRUE(timer.cancel(id));
  EXPECT_FALSE(timer.cancel(id));

  std::this_thread::sleep_for(80ms);
  EXPECT_FALSE(fired.load());
}

TEST(DeadlineTimerTest, StopDropsPendingTimers) {
  DeadlineTimer timer;
  std::atomic<bool> fired{false};
  timer.schedule(10s, [&] { fired = true; });
  EXPECT_EQ(timer.pending(), 1u);
  timer.stop();
  EXPECT_FALSE(fired.load());
}

TEST(DeadlineTimerTest, HugeDelayStaysPending) {
  DeadlineTimer timer;
  std::atomic<bool> fired{false};
  timer.schedule(std::chrono::milliseconds::max(), [&] { fired = true; });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(fired.load());
  EXPECT_EQ(timer.pending(), 1u);
}
