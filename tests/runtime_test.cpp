#include "taskcore/core/runtime.hpp"
#include "taskcore/executor/async_semaphore.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskcore;
using namespace std::chrono_literals;

namespace {

auto increment_counter(std::atomic<int>* count) -> detached_task {
  count->fetch_add(1);
  co_return;
}

auto record_carrier(test::BlockingQueue<bool>* out) -> detached_task {
  out->push(on_carrier());
  co_return;
}

auto sleep_then_report(std::chrono::milliseconds d,
                       test::BlockingQueue<std::chrono::nanoseconds>* out)
    -> detached_task {
  auto start = std::chrono::steady_clock::now();
  co_await async_sleep(d);
  out->push(std::chrono::steady_clock::now() - start);
}

auto sleep_with_token(CancellationToken token, test::BlockingQueue<bool>* out)
    -> detached_task {
  out->push(co_await async_sleep(10s, std::move(token)));
}

auto yield_many(int times, std::atomic<int>* count) -> detached_task {
  for (int i = 0; i < times; ++i) {
    co_await yield_now();
    count->fetch_add(1);
  }
}

auto add_async(int a, int b) -> task<int> {
  co_return a + b;
}

auto nested_sum() -> task<int> {
  auto x = co_await add_async(1, 2);
  auto y = co_await add_async(x, 4);
  co_return y;
}

auto throwing_task() -> task<int> {
  throw std::runtime_error("boom");
  co_return 0;
}

auto hold_permit(AsyncSemaphore* sem, std::atomic<int>* inside,
                 std::atomic<int>* peak, std::atomic<int>* done)
    -> detached_task {
  auto guard = co_await sem->acquire();
  auto now = inside->fetch_add(1) + 1;
  auto prev = peak->load();
  while (now > prev && !peak->compare_exchange_weak(prev, now)) {
  }
  co_await async_sleep(20ms);
  inside->fetch_sub(1);
  done->fetch_add(1);
}

}  // namespace

TEST(RuntimeTest, BasicStartStop) {
  Runtime rt(1);
  EXPECT_FALSE(rt.is_running());
  rt.start();
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());

  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, CarrierCount) {
  Runtime rt(3);
  EXPECT_EQ(rt.carrier_count(), 3u);

  Runtime hw(0);
  EXPECT_GE(hw.carrier_count(), 1u);
}

TEST(RuntimeTest, NotOnCarrierOutsideContext) {
  Runtime rt(2);
  rt.start();
  EXPECT_FALSE(rt.is_current_carrier());
  EXPECT_FALSE(on_carrier());
  rt.stop();
}

TEST(RuntimeTest, SpawnedCoroutineRunsOnCarrier) {
  Runtime rt(2);
  rt.start();

  test::BlockingQueue<bool> seen;
  rt.spawn(record_carrier(&seen));
  auto value = seen.try_pop_for(2s);
  ASSERT_TRUE(value.has_value());
  EXPECT_TRUE(*value);

  rt.stop();
}

TEST(RuntimeTest, SpawnManyAcrossCarriers) {
  Runtime rt(4);
  rt.start();

  std::atomic<int> count{0};
  for (int i = 0; i < 200; ++i) {
    rt.spawn(increment_counter(&count));
  }
  EXPECT_TRUE(test::wait_until([&] { return count.load() == 200; }));

  rt.stop();
}

TEST(RuntimeTest, AsyncSleep_SuspendsForDuration) {
  Runtime rt(1);
  rt.start();

  test::BlockingQueue<std::chrono::nanoseconds> elapsed;
  rt.spawn(sleep_then_report(30ms, &elapsed));
  auto value = elapsed.try_pop_for(2s);
  ASSERT_TRUE(value.has_value());
  EXPECT_GE(*value, 30ms);

  rt.stop();
}

TEST(RuntimeTest, AsyncSleep_CancelledTokenIsImmediate) {
  Runtime rt(1);
  rt.start();

  CancellationSource source;
  source.cancel();
  test::BlockingQueue<bool> result;
  rt.spawn(sleep_with_token(source.token(), &result));
  auto value = result.try_pop_for(1s);
  ASSERT_TRUE(value.has_value());
  EXPECT_FALSE(*value);

  rt.stop();
}

TEST(RuntimeTest, AsyncSleep_OffCarrierBlocksAndWakesOnCancel) {
  CancellationSource source;
  std::thread canceller([&] {
    std::this_thread::sleep_for(20ms);
    source.cancel();
  });

  auto sleeper = [](CancellationToken token) -> task<bool> {
    co_return co_await async_sleep(10s, std::move(token));
  };
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(sync_wait(sleeper(source.token())));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  canceller.join();
}

TEST(RuntimeTest, YieldInterleavesCoroutines) {
  Runtime rt(1);
  rt.start();

  std::atomic<int> count{0};
  rt.spawn(yield_many(50, &count));
  rt.spawn(yield_many(50, &count));
  EXPECT_TRUE(test::wait_until([&] { return count.load() == 100; }));

  rt.stop();
}

TEST(RuntimeTest, YieldOffCarrierIsNoop) {
  auto body = []() -> task<int> {
    co_await yield_now();
    co_return 7;
  };
  EXPECT_EQ(sync_wait(body()), 7);
}

TEST(CoroutineTest, SyncWait_ReturnsNestedResult) {
  EXPECT_EQ(sync_wait(nested_sum()), 7);
}

TEST(CoroutineTest, SyncWait_RethrowsException) {
  EXPECT_THROW((void)sync_wait(throwing_task()), std::runtime_error);
}

TEST(CoroutineTest, UnawaitedTaskIsDestroyedWithoutRunning) {
  bool ran = false;
  {
    auto body = [](bool* flag) -> task<void> {
      *flag = true;
      co_return;
    };
    auto t = body(&ran);
    EXPECT_FALSE(t.done());
  }
  EXPECT_FALSE(ran);
}

TEST(AsyncSemaphoreTest, LimitsConcurrentHolders) {
  Runtime rt(2);
  rt.start();
  AsyncSemaphore sem(2, rt);

  std::atomic<int> inside{0};
  std::atomic<int> peak{0};
  std::atomic<int> done{0};
  for (int i = 0; i < 8; ++i) {
    rt.spawn(hold_permit(&sem, &inside, &peak, &done));
  }

  EXPECT_TRUE(test::wait_until([&] { return done.load() == 8; }));
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
  EXPECT_EQ(sem.available(), 2u);
  EXPECT_EQ(sem.waiting(), 0u);

  rt.stop();
}
