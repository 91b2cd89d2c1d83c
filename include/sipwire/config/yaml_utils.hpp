#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace sipwire {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return default_val;
  }
  return field.as<T>();
}

}  // namespace sipwire
