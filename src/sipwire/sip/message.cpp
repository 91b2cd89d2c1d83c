#include "sipwire/sip/message.hpp"

#include "sipwire/sip/scanner.hpp"
#include "sipwire/util/utf8.hpp"

namespace sipwire {
namespace {

auto interrupted(const Halt& halt) -> ParseResult {
  if (halt.is_incomplete()) {
    return ParseResult::incomplete(halt.needed);
  }
  return ParseResult::failed(halt.error, halt.offset);
}

auto scan_request_line(Cursor& cur, Request& req) -> Scan<void> {
  auto method = scan::token(cur);
  if (!method) {
    return std::unexpected(method.error());
  }
  req.method = *method;

  if (auto r = scan::space(cur); !r) {
    return r;
  }

  auto target = scan::take_while1(cur, chars::is_request_uri, Error::Token);
  if (!target) {
    return std::unexpected(target.error());
  }
  req.target = as_text(*target);

  if (auto r = scan::space(cur); !r) {
    return r;
  }

  auto version = scan::version(cur);
  if (!version) {
    return std::unexpected(version.error());
  }
  req.version = *version;

  return scan::crlf(cur);
}

auto scan_status_line(Cursor& cur, Response& res) -> Scan<void> {
  auto version = scan::version(cur);
  if (!version) {
    return std::unexpected(version.error());
  }
  res.version = *version;

  if (auto r = scan::space(cur); !r) {
    return r;
  }

  auto code = scan::status_code(cur);
  if (!code) {
    return std::unexpected(code.error());
  }
  res.code = *code;

  if (auto r = scan::space(cur); !r) {
    return r;
  }

  auto start = cur.pos();
  auto reason = scan::take_while(cur, chars::is_reason_phrase);
  if (!reason) {
    return std::unexpected(reason.error());
  }
  if (auto bad = utf8::first_invalid(*reason)) {
    return std::unexpected(Halt::failed(Error::Encoding, start + *bad));
  }
  res.reason = as_text(*reason);

  return scan::crlf(cur);
}

// Header block plus the blank line closing it.
auto scan_header_section(Cursor& cur, HeaderList& headers) -> Scan<void> {
  HeaderScanner scanner{headers};
  if (auto r = scanner.scan(cur); !r) {
    return std::unexpected(r.error());
  }

  auto line_start = cur.pos();
  auto blank = scan::crlf(cur);
  if (!blank && !blank.error().is_incomplete() &&
      headers.size() == headers.capacity()) {
    return std::unexpected(Halt::failed(Error::TooManyHeaders, line_start));
  }
  return blank;
}

}  // namespace

auto Request::parse(Bytes buf) -> ParseResult {
  Cursor cur{buf};
  if (auto r = scan::skip_empty_lines(cur); !r) {
    return interrupted(r.error());
  }
  if (auto r = scan_request_line(cur, *this); !r) {
    return interrupted(r.error());
  }
  if (auto r = scan_header_section(cur, headers); !r) {
    return interrupted(r.error());
  }
  return ParseResult::done(cur.pos());
}

auto Response::parse(Bytes buf) -> ParseResult {
  Cursor cur{buf};
  if (auto r = scan::skip_empty_lines(cur); !r) {
    return interrupted(r.error());
  }
  if (auto r = scan_status_line(cur, *this); !r) {
    return interrupted(r.error());
  }
  if (auto r = scan_header_section(cur, headers); !r) {
    return interrupted(r.error());
  }
  return ParseResult::done(cur.pos());
}

auto parse_headers(Bytes buf, HeaderList& headers) -> ParseResult {
  Cursor cur{buf};
  if (auto r = scan_header_section(cur, headers); !r) {
    return interrupted(r.error());
  }
  return ParseResult::done(cur.pos());
}

}  // namespace sipwire
