#pragma once

#include "sipwire/config/inspect_config.hpp"
#include "sipwire/core/error.hpp"

#include <string_view>

namespace sipwire {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<InspectConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<InspectConfig>;
  [[nodiscard]] static auto validate(const InspectConfig& config)
      -> Result<void>;
};

}  // namespace sipwire
