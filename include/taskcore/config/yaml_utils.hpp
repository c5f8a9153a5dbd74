#pragma once

#include "taskcore/util/names.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>
#include <string_view>

namespace YAML {

// Enums are written by name; an unknown name fails the conversion.
template <taskcore::NamedEnum E>
struct convert<E> {
  static auto encode(const E& value) -> Node {
    return Node(std::string(taskcore::to_string_view(value)));
  }
  static auto decode(const Node& node, E& value) -> bool {
    if (!node.IsScalar()) {
      return false;
    }
    auto parsed = taskcore::parse<E>(node.Scalar());
    if (!parsed) {
      return false;
    }
    value = *parsed;
    return true;
  }
};

}  // namespace YAML

namespace taskcore {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) {
  { n.as<T>() };
};

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

[[nodiscard]] inline auto yaml_get_ms(const YAML::Node& node,
                                      std::string_view key,
                                      std::chrono::milliseconds default_val)
    -> std::chrono::milliseconds {
  return std::chrono::milliseconds(
      yaml_get_or<long long>(node, key, default_val.count()));
}

}  // namespace taskcore
