#pragma once

#include "taskcore/core/constants.hpp"
#include "taskcore/core/lockfree_queue.hpp"
#include "taskcore/util/names.hpp"

#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace taskcore::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

}  // namespace taskcore::log

namespace taskcore {
template <>
struct enum_names<log::Level> {
  static constexpr std::array<std::string_view, 6> values = {
      "trace", "debug", "info", "warn", "error", "off",
  };
};
}  // namespace taskcore

namespace taskcore::log {

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  if (name == "warning") {
    return Level::Warn;
  }
  return parse<Level>(name);
}

// One log line as captured on the calling thread. The writer adds the prefix.
struct Record {
  Level level{Level::Info};
  std::chrono::system_clock::time_point at;
  std::size_t thread{0};
  std::string text;
};

// Callers format only their message and hand it to a single writer thread
// draining a lock-free queue into stderr. Before start(), after stop(), or
// when the queue is full, the caller writes the line itself.
class Logger {
public:
  Logger() : color_{isatty(STDERR_FILENO) == 1} {
  }
  ~Logger() {
    stop();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true)) {
      return;
    }
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { drain_until_stopped(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_seq_cst);
    if (!running_.exchange(false)) {
      return;
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_relaxed);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level != Level::Off && level >= this->level();
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    Record rec{
        .level = level,
        .at = std::chrono::system_clock::now(),
        .thread = std::hash<std::thread::id>{}(std::this_thread::get_id()) %
                  1000000,
        .text = std::format(fmt, std::forward<Args>(args)...),
    };
    if (accepting_.load(std::memory_order_acquire) && queue_.try_push(rec)) {
      return;
    }
    emit(rec);
    std::fflush(stderr);
  }

private:
  static constexpr std::size_t kBatch = 64;

  auto drain_until_stopped() -> void {
    while (running_.load(std::memory_order_acquire)) {
      if (drain(kBatch) == 0) {
        std::this_thread::sleep_for(timing::kLogWriterIdle);
      }
    }
    // accepting_ went false before running_, so this empties the ring.
    while (drain(kBatch) > 0) {
    }
  }

  auto drain(std::size_t max) -> std::size_t {
    std::size_t n = 0;
    while (n < max) {
      auto rec = queue_.try_pop();
      if (!rec) {
        break;
      }
      emit(*rec);
      ++n;
    }
    if (n > 0) {
      std::fflush(stderr);
    }
    return n;
  }

  auto emit(const Record& rec) const -> void {
    auto name = to_string_view(rec.level);
    auto stamp = std::chrono::floor<std::chrono::milliseconds>(rec.at);
    auto line =
        color_
            ? std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\033[0m] [{}] {}\n",
                          stamp, color_of(rec.level), name, rec.thread, rec.text)
            : std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", stamp, name,
                          rec.thread, rec.text);
    std::fputs(line.c_str(), stderr);
  }

  [[nodiscard]] static constexpr auto color_of(Level level) noexcept
      -> std::string_view {
    switch (level) {
      case Level::Trace:
        return "\033[90m";
      case Level::Debug:
        return "\033[36m";
      case Level::Info:
        return "\033[32m";
      case Level::Warn:
        return "\033[33m";
      case Level::Error:
        return "\033[31m";
      case Level::Off:
        break;
    }
    return "";
  }

  const bool color_;
  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<Record> queue_{limits::kLogQueueCapacity};
  std::thread writer_;
};

inline auto logger() -> Logger& {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names fall back to info.
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto start() -> void {
  logger().start();
}

inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace taskcore::log
