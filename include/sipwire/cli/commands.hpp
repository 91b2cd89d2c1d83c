#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace sipwire::cli {

struct InspectOptions {
  std::string file;
  std::string config_file;
  std::optional<std::size_t> max_headers;
  std::optional<std::size_t> chunk_size;
  std::optional<std::string> log_level;
  bool response{false};
};

[[nodiscard]] auto cmd_inspect(const InspectOptions& opts) -> int;

}  // namespace sipwire::cli
