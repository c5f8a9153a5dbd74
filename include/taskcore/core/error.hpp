#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace taskcore {

enum class Error : int {
  Success,
  TaskDependency,
  TaskNotFound,
  InvalidTaskState,
  TaskExecution,
  TaskTimeout,
  TaskCancellation,
  Cancelled,
  InvalidArgument,
  FileNotFound,
  ParseError,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "task dependency cannot be satisfied",
      "task not found",
      "invalid task state",
      "task execution failed",
      "task timed out",
      "task cancellation failed",
      "cancelled",
      "invalid argument",
      "file not found",
      "parse error",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "taskcore";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace taskcore

template <>
struct std::is_error_code_enum<taskcore::Error> : std::true_type {};

