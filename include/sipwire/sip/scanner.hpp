#pragma once

#include "sipwire/core/error.hpp"
#include "sipwire/sip/char_class.hpp"
#include "sipwire/sip/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>

namespace sipwire {

/// Why a scan stopped before producing a value.
struct Halt {
  enum class Kind : std::uint8_t { Incomplete, Failed };

  Kind kind{Kind::Incomplete};
  std::error_code error{};
  /// Offending byte, counted from the start of the buffer (Failed only).
  std::size_t offset{0};
  /// Additional bytes known to be required (Incomplete only).
  std::size_t needed{1};

  [[nodiscard]] static auto incomplete(std::size_t needed) noexcept -> Halt {
    return {Kind::Incomplete, {}, 0, needed};
  }

  [[nodiscard]] static auto failed(Error e, std::size_t offset) -> Halt {
    return {Kind::Failed, make_error_code(e), offset, 0};
  }

  [[nodiscard]] auto is_incomplete() const noexcept -> bool {
    return kind == Kind::Incomplete;
  }
};

template <typename T>
using Scan = std::expected<T, Halt>;

/// Read position over a borrowed buffer.
class Cursor {
public:
  explicit Cursor(Bytes buf) noexcept : buf_(buf) {}

  [[nodiscard]] auto pos() const noexcept -> std::size_t {
    return pos_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return buf_.size();
  }

  [[nodiscard]] auto remaining() const noexcept -> std::size_t {
    return buf_.size() - pos_;
  }

  [[nodiscard]] auto at_end() const noexcept -> bool {
    return pos_ >= buf_.size();
  }

  [[nodiscard]] auto byte_at(std::size_t i) const noexcept -> std::uint8_t {
    return buf_[i];
  }

  [[nodiscard]] auto current() const noexcept -> std::uint8_t {
    return buf_[pos_];
  }

  [[nodiscard]] auto slice(std::size_t from, std::size_t to) const noexcept
      -> Bytes {
    return buf_.subspan(from, to - from);
  }

  auto advance(std::size_t n) noexcept -> void {
    pos_ += n;
  }

  auto seek(std::size_t pos) noexcept -> void {
    pos_ = pos;
  }

private:
  Bytes buf_;
  std::size_t pos_{0};
};

namespace scan {

/// Maximal run of bytes satisfying pred; may be empty. A run that reaches the
/// end of the buffer is incomplete since more matching bytes may follow.
template <typename Pred>
[[nodiscard]] auto take_while(Cursor& cur, Pred pred) -> Scan<Bytes> {
  auto start = cur.pos();
  auto i = start;
  while (i < cur.size() && pred(cur.byte_at(i))) {
    ++i;
  }
  if (i == cur.size()) {
    return std::unexpected(Halt::incomplete(1));
  }
  cur.seek(i);
  return cur.slice(start, i);
}

/// Like take_while, but an empty run fails with `err`.
template <typename Pred>
[[nodiscard]] auto take_while1(Cursor& cur, Pred pred, Error err)
    -> Scan<Bytes> {
  auto start = cur.pos();
  auto run = take_while(cur, pred);
  if (run && run->empty()) {
    return std::unexpected(Halt::failed(err, start));
  }
  return run;
}

[[nodiscard]] auto digit(Cursor& cur, Error err) -> Scan<std::uint8_t>;
[[nodiscard]] auto space(Cursor& cur) -> Scan<void>;
[[nodiscard]] auto crlf(Cursor& cur) -> Scan<void>;

/// Reports whether the next two bytes are CRLF without consuming them.
[[nodiscard]] auto peek_crlf(const Cursor& cur) -> Scan<bool>;

[[nodiscard]] auto tag_no_case(Cursor& cur, std::string_view tag, Error err)
    -> Scan<void>;

/// Skips any number of CRLF or bare LF lines.
[[nodiscard]] auto skip_empty_lines(Cursor& cur) -> Scan<void>;

[[nodiscard]] auto token(Cursor& cur) -> Scan<std::string_view>;

/// HCOLON = *( SP / HTAB ) ":" *( SP / HTAB )
[[nodiscard]] auto hcolon(Cursor& cur) -> Scan<void>;

/// SIP-Version = "SIP" "/" DIGIT "." DIGIT, case-insensitive.
[[nodiscard]] auto version(Cursor& cur) -> Scan<SipVersion>;

/// Status-Code = 3DIGIT. Incomplete until the byte after the third digit is
/// seen.
[[nodiscard]] auto status_code(Cursor& cur) -> Scan<std::uint16_t>;

/// Header value up to its line terminator, following folded continuation
/// lines. Trailing blanks are trimmed; the cursor is left on the terminator.
[[nodiscard]] auto header_value(Cursor& cur) -> Scan<Bytes>;

/// message-header = header-name HCOLON header-value CRLF
[[nodiscard]] auto message_header(Cursor& cur) -> Scan<Header>;

}  // namespace scan

/// Fills a HeaderList from consecutive header lines.
class HeaderScanner {
public:
  explicit HeaderScanner(HeaderList& out) noexcept : out_(out) {}

  /// Stops at the blank line (not consumed) or once every slot is used.
  /// The list's size is updated to the headers recognized, whatever the
  /// outcome.
  [[nodiscard]] auto scan(Cursor& cur) -> Scan<std::size_t>;

private:
  HeaderList& out_;
};

}  // namespace sipwire
