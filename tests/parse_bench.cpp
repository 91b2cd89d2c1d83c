#include "sipwire/sip/message.hpp"

#include <array>
#include <cstdint>
#include <string_view>

#include <benchmark/benchmark.h>

using namespace sipwire;
using namespace std::string_view_literals;

namespace {

constexpr auto kInvite =
    "INVITE sip:bob@biloxi.com SIP/2.0\r\n"
    "Via: SIP/2.0/UDP bigbox3.site3.atlanta.com;branch=z9hG4bK77ef4c2312983.1\r\n"
    "Via: SIP/2.0/UDP pc33.atlanta.com;branch=z9hG4bKnashds8;received=192.0.2.1\r\n"
    "Max-Forwards: 69\r\n"
    "To: Bob <sip:bob@biloxi.com>\r\n"
    "From: Alice <sip:alice@atlanta.com>;tag=1928301774\r\n"
    "Call-ID: a84b4c76e66710\r\n"
    "CSeq: 314159 INVITE\r\n"
    "Contact: <sip:alice@pc33.atlanta.com>\r\n"
    "Content-Type: application/sdp\r\n"
    "Content-Length: 0\r\n"
    "\r\n"sv;

constexpr auto kOk =
    "SIP/2.0 200 OK\r\n"
    "Via: SIP/2.0/UDP server10.biloxi.com;branch=z9hG4bKnashds8;received=192.0.2.3\r\n"
    "To: Bob <sip:bob@biloxi.com>;tag=a6c85cf\r\n"
    "From: Alice <sip:alice@atlanta.com>;tag=1928301774\r\n"
    "Call-ID: a84b4c76e66710@pc33.atlanta.com\r\n"
    "CSeq: 314159 INVITE\r\n"
    "Contact: <sip:bob@192.0.2.4>\r\n"
    "Content-Length: 0\r\n"
    "\r\n"sv;

}  // namespace

static void BM_ParseRequest(benchmark::State& state) {
  std::array<Header, 16> slots{};
  HeaderList headers{slots};
  Request req{headers};

  for (auto _ : state) {
    auto result = req.parse(kInvite);
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(
      static_cast<std::int64_t>(kInvite.size() * state.iterations()));
}

static void BM_ParseResponse(benchmark::State& state) {
  std::array<Header, 16> slots{};
  HeaderList headers{slots};
  Response res{headers};

  for (auto _ : state) {
    auto result = res.parse(kOk);
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(
      static_cast<std::int64_t>(kOk.size() * state.iterations()));
}

static void BM_ParseHeaders(benchmark::State& state) {
  auto block = kInvite.substr(kInvite.find("\r\n") + 2);
  std::array<Header, 16> slots{};
  HeaderList headers{slots};

  for (auto _ : state) {
    auto result = parse_headers(as_bytes(block), headers);
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(
      static_cast<std::int64_t>(block.size() * state.iterations()));
}

// Re-parses growing prefixes, the way a reader fed by small socket reads
// would.
static void BM_ParseRequestIncremental(benchmark::State& state) {
  const auto step = static_cast<std::size_t>(state.range(0));
  std::array<Header, 16> slots{};
  HeaderList headers{slots};
  Request req{headers};

  for (auto _ : state) {
    for (std::size_t n = step; n < kInvite.size() + step; n += step) {
      auto result = req.parse(kInvite.substr(0, n));
      benchmark::DoNotOptimize(result);
    }
  }

  state.SetBytesProcessed(
      static_cast<std::int64_t>(kInvite.size() * state.iterations()));
}

BENCHMARK(BM_ParseRequest);
BENCHMARK(BM_ParseResponse);
BENCHMARK(BM_ParseHeaders);
BENCHMARK(BM_ParseRequestIncremental)->Arg(16)->Arg(64)->Arg(256);
