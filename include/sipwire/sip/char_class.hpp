#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace sipwire::chars {

namespace detail {

using ByteMap = std::array<bool, 256>;

[[nodiscard]] constexpr auto in_range(unsigned b, unsigned lo,
                                      unsigned hi) noexcept -> bool {
  return b >= lo && b <= hi;
}

[[nodiscard]] constexpr auto is_alphanum(unsigned b) noexcept -> bool {
  return in_range(b, 'a', 'z') || in_range(b, 'A', 'Z') ||
         in_range(b, '0', '9');
}

[[nodiscard]] constexpr auto is_one_of(unsigned b,
                                       std::string_view set) noexcept -> bool {
  return set.find(static_cast<char>(b)) != std::string_view::npos;
}

template <typename Pred>
[[nodiscard]] consteval auto make_map(Pred pred) -> ByteMap {
  ByteMap map{};
  for (unsigned b = 0; b < map.size(); ++b) {
    map[b] = pred(b);
  }
  return map;
}

// token = 1*(alphanum / "-" / "." / "!" / "%" / "*" / "_" / "+" / "`" / "'" / "~")
inline constexpr ByteMap kToken = make_map([](unsigned b) {
  return is_alphanum(b) || is_one_of(b, "-.!%*_+`'~");
});

// Opaque request target: any visible ASCII byte.
inline constexpr ByteMap kRequestUri =
    make_map([](unsigned b) { return in_range(b, 0x21, 0x7E); });

// Reason-Phrase = *(reserved / unreserved / escaped / UTF8-NONASCII / UTF8-CONT
//                   / SP / HTAB), widened to all visible ASCII.
inline constexpr ByteMap kReasonPhrase = make_map([](unsigned b) {
  return in_range(b, 0x21, 0x7E) || in_range(b, 0x80, 0xFF) || b == ' ' ||
         b == '\t';
});

// header-value = *(TEXT-UTF8char / UTF8-CONT / LWS), plus NUL, BEL and DEL
// which deployed stacks are known to emit.
inline constexpr ByteMap kHeaderValue = make_map([](unsigned b) {
  return in_range(b, 0x21, 0x7E) ||  // TEXT-UTF8char, ASCII part
         in_range(b, 0x80, 0xBF) ||  // UTF8-CONT
         in_range(b, 0xC0, 0xFD) ||  // UTF8-NONASCII lead bytes
         b == ' ' || b == '\t' || b == '\r' || b == '\n' || b == 0x00 ||
         b == 0x07 || b == 0x7F;
});

}  // namespace detail

[[nodiscard]] constexpr auto is_token(std::uint8_t b) noexcept -> bool {
  return detail::kToken[b];
}

[[nodiscard]] constexpr auto is_request_uri(std::uint8_t b) noexcept -> bool {
  return detail::kRequestUri[b];
}

[[nodiscard]] constexpr auto is_reason_phrase(std::uint8_t b) noexcept
    -> bool {
  return detail::kReasonPhrase[b];
}

[[nodiscard]] constexpr auto is_header_value(std::uint8_t b) noexcept -> bool {
  return detail::kHeaderValue[b];
}

[[nodiscard]] constexpr auto is_blank(std::uint8_t b) noexcept -> bool {
  return b == ' ' || b == '\t';
}

[[nodiscard]] constexpr auto is_digit(std::uint8_t b) noexcept -> bool {
  return b >= '0' && b <= '9';
}

}  // namespace sipwire::chars
