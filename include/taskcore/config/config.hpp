#pragma once

#include "taskcore/config/system_config.hpp"
#include "taskcore/core/error.hpp"

#include <string_view>

namespace taskcore {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Range checks applied after parsing.
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;
};

}  // namespace taskcore
