#pragma once

#include <chrono>
#include <cstddef>

namespace taskcore {

namespace limits {
inline constexpr int kDefaultMaxConcurrentTasks = 4;
inline constexpr std::size_t kDefaultAsyncConcurrency = 10;
inline constexpr unsigned kDefaultCarrierThreads = 2;
inline constexpr std::size_t kCarrierRemoteQueueSize = 4096;
inline constexpr unsigned kTimerRingEntries = 256;
inline constexpr std::size_t kLogQueueCapacity = 8192;
}  // namespace limits

namespace timing {
inline constexpr auto kSchedulerTick = std::chrono::milliseconds(100);
inline constexpr auto kDependencyPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kCarrierIdleWait = std::chrono::milliseconds(1000);
inline constexpr auto kCarrierFallbackSleep = std::chrono::milliseconds(1);
inline constexpr auto kLogWriterIdle = std::chrono::microseconds(100);
inline constexpr auto kCooperativeSleepSlice = std::chrono::milliseconds(10);
inline constexpr auto kShutdownGracePeriod = std::chrono::milliseconds(1000);
inline constexpr auto kMaxRetryBackoff = std::chrono::hours(24);
inline constexpr auto kMaxTaskTimeout = std::chrono::hours(24 * 30);
}  // namespace timing

}  // namespace taskcore
