#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace taskcore {

// Specialize with `static constexpr std::array<std::string_view, N> values`
// listing the enumerator names in declaration order.
template <typename E>
struct enum_names;

template <typename E>
concept NamedEnum = std::is_enum_v<E> && requires {
  { enum_names<E>::values.size() } -> std::convertible_to<std::size_t>;
};

template <NamedEnum E>
[[nodiscard]] constexpr auto to_string_view(E value) noexcept
    -> std::string_view {
  auto idx = static_cast<std::size_t>(std::to_underlying(value));
  return idx < enum_names<E>::values.size() ? enum_names<E>::values[idx]
                                            : std::string_view{"UNKNOWN"};
}

template <NamedEnum E>
[[nodiscard]] constexpr auto parse(std::string_view name) noexcept
    -> std::optional<E> {
  const auto& names = enum_names<E>::values;
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<E>(std::ranges::distance(names.begin(), it));
}

}  // namespace taskcore
