#pragma once

#include "sipwire/sip/parse_result.hpp"
#include "sipwire/sip/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace sipwire {

/// A SIP request, parsed in place over a caller-owned buffer.
///
/// Fields stay nullopt until their scan completes, so after an incomplete or
/// failed parse the recognized prefix can still be inspected. Each call to
/// parse() re-reads the buffer from its start and overwrites fields it
/// reaches; fields it does not reach keep their previous values.
///
/// ```
/// std::array<sipwire::Header, 16> slots{};
/// sipwire::HeaderList headers{slots};
/// sipwire::Request req{headers};
/// auto result = req.parse(buf);
/// if (result.is_incomplete() && req.target) {
///   // route on the target before the rest arrives
/// }
/// ```
struct Request {
  /// e.g. `INVITE`
  std::optional<std::string_view> method;
  /// Request-URI as an opaque span, e.g. `sip:callee@domain.com`
  std::optional<std::string_view> target;
  std::optional<SipVersion> version;
  HeaderList& headers;

  explicit Request(HeaderList& headers) noexcept : headers(headers) {}

  /// Request-Line = Method SP Request-URI SP SIP-Version CRLF
  [[nodiscard]] auto parse(Bytes buf) -> ParseResult;

  [[nodiscard]] auto parse(std::string_view buf) -> ParseResult {
    return parse(as_bytes(buf));
  }
};

/// A SIP response. See Request for the partial-result rules.
struct Response {
  std::optional<SipVersion> version;
  std::optional<std::uint16_t> code;
  /// May be empty.
  std::optional<std::string_view> reason;
  HeaderList& headers;

  explicit Response(HeaderList& headers) noexcept : headers(headers) {}

  /// Status-Line = SIP-Version SP Status-Code SP Reason-Phrase CRLF
  [[nodiscard]] auto parse(Bytes buf) -> ParseResult;

  [[nodiscard]] auto parse(std::string_view buf) -> ParseResult {
    return parse(as_bytes(buf));
  }
};

/// Parses a header block and its terminating blank line.
///
/// ```
/// auto buf = "Host: foo.bar\r\nAccept: */*\r\n\r\n"sv;
/// std::array<sipwire::Header, 4> slots{};
/// sipwire::HeaderList headers{slots};
/// auto r = sipwire::parse_headers(sipwire::as_bytes(buf), headers);
/// // r.consumed() == 30, headers.size() == 2
/// ```
[[nodiscard]] auto parse_headers(Bytes buf, HeaderList& headers)
    -> ParseResult;

}  // namespace sipwire
