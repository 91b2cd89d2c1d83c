#pragma once

#include <cstddef>
#include <string>

namespace sipwire {

inline constexpr std::size_t kDefaultMaxHeaders = 32;
inline constexpr std::size_t kMaxHeadersLimit = 1024;

struct ParserConfig {
  std::size_t max_headers{kDefaultMaxHeaders};
  bool response{false};
};

struct FeedConfig {
  // Bytes handed to the parser per simulated read; 0 feeds the whole file.
  std::size_t chunk_size{0};
};

struct LogConfig {
  std::string level{"info"};
};

struct InspectConfig {
  ParserConfig parser;
  FeedConfig feed;
  LogConfig log;
};

}  // namespace sipwire
