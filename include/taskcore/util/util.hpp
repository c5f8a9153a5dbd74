#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <random>
#include <string>

namespace taskcore {

// Random (version 4) UUID in canonical text form.
inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-01-01T12:00:00.123Z
inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  auto time = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;
  if (ms.count() < 0) {
    ms += std::chrono::seconds(1);
  }
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
}

inline auto format_timestamp() -> std::string {
  return format_timestamp(std::chrono::system_clock::now());
}

}  // namespace taskcore
