#pragma once

#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace taskcore {

struct TaskTag {};

// Phantom-typed string id. Conversion to and from std::string is explicit.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs)
      -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace taskcore

template <typename Tag>
struct std::hash<taskcore::TypedId<Tag>> {
  auto operator()(const taskcore::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<taskcore::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const taskcore::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

template <typename Tag>
struct nlohmann::adl_serializer<taskcore::TypedId<Tag>> {
  static auto to_json(nlohmann::json& j, const taskcore::TypedId<Tag>& id)
      -> void {
    j = id.str();
  }
  static auto from_json(const nlohmann::json& j, taskcore::TypedId<Tag>& id)
      -> void {
    id = taskcore::TypedId<Tag>{j.get<std::string>()};
  }
};
