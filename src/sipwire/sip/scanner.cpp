#include "sipwire/sip/scanner.hpp"

namespace sipwire {
namespace {

constexpr auto to_lower(std::uint8_t b) noexcept -> std::uint8_t {
  return (b >= 'A' && b <= 'Z') ? static_cast<std::uint8_t>(b + ('a' - 'A'))
                                : b;
}

auto incomplete(std::size_t needed) -> std::unexpected<Halt> {
  return std::unexpected(Halt::incomplete(needed));
}

auto failed(Error e, std::size_t offset) -> std::unexpected<Halt> {
  return std::unexpected(Halt::failed(e, offset));
}

auto skip_blanks(Cursor& cur) -> Scan<void> {
  while (!cur.at_end() && chars::is_blank(cur.current())) {
    cur.advance(1);
  }
  if (cur.at_end()) {
    return incomplete(1);
  }
  return {};
}

}  // namespace

namespace scan {

auto digit(Cursor& cur, Error err) -> Scan<std::uint8_t> {
  if (cur.at_end()) {
    return incomplete(1);
  }
  auto b = cur.current();
  if (!chars::is_digit(b)) {
    return failed(err, cur.pos());
  }
  cur.advance(1);
  return static_cast<std::uint8_t>(b - '0');
}

auto space(Cursor& cur) -> Scan<void> {
  if (cur.at_end()) {
    return incomplete(1);
  }
  if (cur.current() != ' ') {
    return failed(Error::Delimiter, cur.pos());
  }
  cur.advance(1);
  return {};
}

auto crlf(Cursor& cur) -> Scan<void> {
  if (cur.at_end()) {
    return incomplete(2);
  }
  if (cur.current() != '\r') {
    return failed(Error::NewLine, cur.pos());
  }
  if (cur.remaining() < 2) {
    return incomplete(1);
  }
  if (cur.byte_at(cur.pos() + 1) != '\n') {
    return failed(Error::NewLine, cur.pos() + 1);
  }
  cur.advance(2);
  return {};
}

auto peek_crlf(const Cursor& cur) -> Scan<bool> {
  if (cur.at_end()) {
    return incomplete(2);
  }
  if (cur.current() != '\r') {
    return false;
  }
  if (cur.remaining() < 2) {
    return incomplete(1);
  }
  return cur.byte_at(cur.pos() + 1) == '\n';
}

auto tag_no_case(Cursor& cur, std::string_view tag, Error err) -> Scan<void> {
  auto start = cur.pos();
  for (std::size_t i = 0; i < tag.size(); ++i) {
    if (start + i >= cur.size()) {
      return incomplete(tag.size() - i);
    }
    auto expected = static_cast<std::uint8_t>(tag[i]);
    if (to_lower(cur.byte_at(start + i)) != to_lower(expected)) {
      return failed(err, start + i);
    }
  }
  cur.advance(tag.size());
  return {};
}

auto skip_empty_lines(Cursor& cur) -> Scan<void> {
  while (!cur.at_end()) {
    auto b = cur.current();
    if (b == '\n') {
      cur.advance(1);
    } else if (b == '\r') {
      if (cur.remaining() < 2) {
        return incomplete(1);
      }
      if (cur.byte_at(cur.pos() + 1) != '\n') {
        break;
      }
      cur.advance(2);
    } else {
      break;
    }
  }
  return {};
}

auto token(Cursor& cur) -> Scan<std::string_view> {
  return take_while1(cur, chars::is_token, Error::Token).transform(as_text);
}

auto hcolon(Cursor& cur) -> Scan<void> {
  if (auto r = skip_blanks(cur); !r) {
    return r;
  }
  if (cur.current() != ':') {
    return failed(Error::Delimiter, cur.pos());
  }
  cur.advance(1);
  return skip_blanks(cur);
}

auto version(Cursor& cur) -> Scan<SipVersion> {
  if (auto r = tag_no_case(cur, "SIP/", Error::Version); !r) {
    return std::unexpected(r.error());
  }
  auto major = digit(cur, Error::Version);
  if (!major) {
    return std::unexpected(major.error());
  }
  if (cur.at_end()) {
    return incomplete(2);
  }
  if (cur.current() != '.') {
    return failed(Error::Version, cur.pos());
  }
  cur.advance(1);
  auto minor = digit(cur, Error::Version);
  if (!minor) {
    return std::unexpected(minor.error());
  }
  return SipVersion{*major, *minor};
}

auto status_code(Cursor& cur) -> Scan<std::uint16_t> {
  std::uint16_t code = 0;
  for (int i = 0; i < 3; ++i) {
    auto d = digit(cur, Error::Status);
    if (!d) {
      return std::unexpected(d.error());
    }
    code = static_cast<std::uint16_t>(code * 10 + *d);
  }
  // A fourth digit may still arrive.
  if (cur.at_end()) {
    return incomplete(1);
  }
  if (chars::is_digit(cur.current())) {
    return failed(Error::Status, cur.pos());
  }
  return code;
}

auto header_value(Cursor& cur) -> Scan<Bytes> {
  auto start = cur.pos();
  auto content_end = start;
  auto i = start;
  while (i < cur.size()) {
    auto b = cur.byte_at(i);
    switch (b) {
      case '\n': {
        if (i + 1 >= cur.size()) {
          return incomplete(1);
        }
        if (chars::is_blank(cur.byte_at(i + 1))) {
          i += 2;
          continue;
        }
        auto terminator =
            (i > start && cur.byte_at(i - 1) == '\r') ? i - 1 : i;
        cur.seek(terminator);
        return cur.slice(start, content_end);
      }
      case ' ':
      case '\t':
      case '\r':
        break;
      default:
        if (!chars::is_header_value(b)) {
          return failed(Error::HeaderValue, i);
        }
        content_end = i + 1;
        break;
    }
    ++i;
  }
  return incomplete(1);
}

auto message_header(Cursor& cur) -> Scan<Header> {
  auto name = token(cur);
  if (!name) {
    return std::unexpected(name.error());
  }
  if (auto r = hcolon(cur); !r) {
    return std::unexpected(r.error());
  }
  auto value = header_value(cur);
  if (!value) {
    return std::unexpected(value.error());
  }
  if (auto r = crlf(cur); !r) {
    return std::unexpected(r.error());
  }
  return Header{*name, *value};
}

}  // namespace scan

auto HeaderScanner::scan(Cursor& cur) -> Scan<std::size_t> {
  std::size_t count = 0;
  auto stop = [&](Scan<std::size_t> outcome) {
    out_.len_ = count;
    return outcome;
  };

  while (count < out_.capacity()) {
    auto blank = scan::peek_crlf(cur);
    if (!blank) {
      return stop(std::unexpected(blank.error()));
    }
    if (*blank) {
      break;
    }
    auto header = scan::message_header(cur);
    if (!header) {
      return stop(std::unexpected(header.error()));
    }
    out_.slots_[count++] = *header;
  }
  return stop(count);
}

}  // namespace sipwire
