#include "sipwire/cli/commands.hpp"
#include "sipwire/config/config.hpp"
#include "sipwire/sip/message.hpp"
#include "sipwire/util/log.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <vector>

namespace sipwire::cli {
namespace {

auto read_file(const std::string& path) -> Result<std::vector<std::uint8_t>> {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    log::error("Failed to open message file: {}", path);
    return fail(Error::FileOpenFailed);
  }
  std::vector<std::uint8_t> data{std::istreambuf_iterator<char>(file),
                                 std::istreambuf_iterator<char>()};
  return ok(std::move(data));
}

auto resolve_config(const InspectOptions& opts) -> Result<InspectConfig> {
  InspectConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }
  if (opts.max_headers) {
    config.parser.max_headers = *opts.max_headers;
  }
  if (opts.chunk_size) {
    config.feed.chunk_size = *opts.chunk_size;
  }
  if (opts.log_level) {
    config.log.level = *opts.log_level;
  }
  if (opts.response) {
    config.parser.response = true;
  }
  if (auto r = ConfigLoader::validate(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

auto escape(Bytes bytes) -> std::string {
  std::string out;
  out.reserve(bytes.size());
  for (auto b : bytes) {
    switch (b) {
      case '\r': out += "\\r"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      case '\\': out += "\\\\"; break;
      default:
        if (b < 0x20 || b >= 0x7F) {
          std::format_to(std::back_inserter(out), "\\x{:02x}", b);
        } else {
          out += static_cast<char>(b);
        }
    }
  }
  return out;
}

// Re-parses a growing prefix of the message the way a connection handler
// would as reads complete.
template <typename Message>
auto feed(Message& msg, Bytes data, std::size_t chunk_size) -> ParseResult {
  auto step = chunk_size == 0 ? data.size() : chunk_size;
  auto available = std::min(step, data.size());
  while (true) {
    auto result = msg.parse(data.first(available));
    log::debug("{} with {} of {} bytes", result, available, data.size());
    if (!result.is_incomplete() || available == data.size()) {
      return result;
    }
    auto grow = std::max(step, result.needed().value_or(1));
    available = std::min(available + grow, data.size());
  }
}

auto print_headers(const HeaderList& headers) -> void {
  std::println("headers: {} (capacity {})", headers.size(),
               headers.capacity());
  for (const auto& h : headers) {
    std::println("  {}: {}", h.name, escape(h.value));
  }
}

auto print_outcome(const ParseResult& result, std::size_t total) -> int {
  if (result.is_done()) {
    std::println("consumed: {} bytes, body: {} bytes", result.consumed(),
                 total - result.consumed());
    return 0;
  }
  if (result.is_incomplete()) {
    std::println("incomplete: message truncated after {} bytes", total);
    return 1;
  }
  std::println("error: {} at offset {}", result.error().message(),
               result.offset());
  return 1;
}

auto inspect_request(Bytes data, HeaderList& headers, std::size_t chunk)
    -> int {
  Request req{headers};
  auto result = feed(req, data, chunk);
  std::println("method: {}", req.method.value_or("<none>"));
  std::println("target: {}", req.target.value_or("<none>"));
  if (req.version) {
    std::println("version: {}", *req.version);
  }
  print_headers(headers);
  return print_outcome(result, data.size());
}

auto inspect_response(Bytes data, HeaderList& headers, std::size_t chunk)
    -> int {
  Response res{headers};
  auto result = feed(res, data, chunk);
  if (res.version) {
    std::println("version: {}", *res.version);
  }
  if (res.code) {
    std::println("code: {}", *res.code);
  }
  if (res.reason) {
    std::println("reason: {}", *res.reason);
  }
  print_headers(headers);
  return print_outcome(result, data.size());
}

}  // namespace

auto cmd_inspect(const InspectOptions& opts) -> int {
  auto config = resolve_config(opts);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  log::set_level(config->log.level);

  auto data = read_file(opts.file);
  if (!data) {
    std::println(stderr, "Error: {}", data.error().message());
    return 1;
  }
  log::info("Parsing {} ({} bytes, {} header slots)", opts.file, data->size(),
            config->parser.max_headers);

  std::vector<Header> slots(config->parser.max_headers, kEmptyHeader);
  HeaderList headers{slots};
  Bytes bytes{*data};

  if (config->parser.response) {
    return inspect_response(bytes, headers, config->feed.chunk_size);
  }
  return inspect_request(bytes, headers, config->feed.chunk_size);
}

}  // namespace sipwire::cli
