#include "sipwire/config/config.hpp"

#include "sipwire/config/yaml_utils.hpp"
#include "sipwire/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<sipwire::ParserConfig> {
  static bool decode(const Node& node, sipwire::ParserConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.max_headers = sipwire::yaml_get_or<std::size_t>(
        node, "max_headers", sipwire::kDefaultMaxHeaders);
    p.response = sipwire::yaml_get_or(node, "response", false);
    return true;
  }
};

template <>
struct convert<sipwire::FeedConfig> {
  static bool decode(const Node& node, sipwire::FeedConfig& f) {
    if (!node.IsMap()) {
      return false;
    }
    f.chunk_size = sipwire::yaml_get_or<std::size_t>(node, "chunk_size", 0);
    return true;
  }
};

template <>
struct convert<sipwire::LogConfig> {
  static bool decode(const Node& node, sipwire::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = sipwire::yaml_get_or<std::string>(node, "level", "info");
    return true;
  }
};

template <>
struct convert<sipwire::InspectConfig> {
  static bool decode(const Node& node, sipwire::InspectConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto parser = node["parser"]) {
      c.parser = parser.as<sipwire::ParserConfig>();
    }
    if (auto feed = node["feed"]) {
      c.feed = feed.as<sipwire::FeedConfig>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<sipwire::LogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace sipwire {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<InspectConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<InspectConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    InspectConfig config = root.as<InspectConfig>();
    if (auto r = validate(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::validate(const InspectConfig& config) -> Result<void> {
  if (config.parser.max_headers == 0 ||
      config.parser.max_headers > kMaxHeadersLimit) {
    log::error("parser.max_headers must be between 1 and {}, got {}",
               kMaxHeadersLimit, config.parser.max_headers);
    return fail(Error::InvalidArgument);
  }
  if (!log::level_from_name(config.log.level)) {
    log::error("Unknown log level: {}", config.log.level);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace sipwire
