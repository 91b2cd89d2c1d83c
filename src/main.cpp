#include "sipwire/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("sipwire-inspect - parse a SIP message file");
  std::println("Usage: {} [OPTIONS] <file>", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>     Config file (YAML)");
  std::println("  -r, --response          Parse as a response (default: request)");
  std::println("  --max-headers <n>       Header slots to provide (default: 32)");
  std::println(
      "  --chunk <n>             Feed the file <n> bytes at a time (default: all)");
  std::println("  --log-level <level>     trace, debug, info, warn, error, off");
  std::println("  -v, --version           Show version and exit");
  std::println("  -h, --help              Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} invite.sip", prog);
  std::println("  {} -r --chunk 16 --log-level debug ok.sip", prog);
}

void print_version() {
  std::println("sipwire-inspect v0.1.0");
}

auto parse_size(std::string_view text) -> std::optional<std::size_t> {
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

auto require_arg(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string_view {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto require_size(int& i, int argc, char* argv[], std::string_view flag)
    -> std::size_t {
  auto text = require_arg(i, argc, argv, flag);
  auto value = parse_size(text);
  if (!value) {
    std::println(stderr, "Error: {} expects a non-negative integer, got '{}'",
                 flag, text);
    std::exit(1);
  }
  return *value;
}

auto parse_args(int argc, char* argv[]) -> sipwire::cli::InspectOptions {
  sipwire::cli::InspectOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_arg(i, argc, argv, arg);
    } else if (arg == "-r" || arg == "--response") {
      opts.response = true;
    } else if (arg == "--max-headers") {
      opts.max_headers = require_size(i, argc, argv, arg);
    } else if (arg == "--chunk") {
      opts.chunk_size = require_size(i, argc, argv, arg);
    } else if (arg == "--log-level") {
      opts.log_level = std::string(require_arg(i, argc, argv, arg));
    } else if (!arg.empty() && arg.front() == '-') {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (opts.file.empty()) {
      opts.file = arg;
    } else {
      std::println(stderr, "Error: only one message file may be given");
      std::exit(1);
    }
  }

  if (opts.file.empty()) {
    print_usage(argv[0]);
    std::exit(1);
  }
  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  return sipwire::cli::cmd_inspect(opts);
}
