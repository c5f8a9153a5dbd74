#pragma once

#include "taskcore/util/names.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace taskcore {

enum class ExecutorType : std::uint8_t {
  Sequential,
  ThreadPool,
  Async,
};

template <>
struct enum_names<ExecutorType> {
  static constexpr std::array<std::string_view, 3> values = {
      "sequential",
      "thread_pool",
      "async",
  };
};

inline constexpr std::array kAllExecutorTypes = {
    ExecutorType::Sequential,
    ExecutorType::ThreadPool,
    ExecutorType::Async,
};

}  // namespace taskcore
