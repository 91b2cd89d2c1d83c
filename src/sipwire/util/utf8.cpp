#include "sipwire/util/utf8.hpp"

namespace sipwire::utf8 {
namespace {

constexpr auto is_cont(std::uint8_t b) noexcept -> bool {
  return (b & 0xC0) == 0x80;
}

struct LeadInfo {
  std::size_t length;
  // Allowed range of the second byte, narrower than 80..BF for leads that
  // would otherwise admit overlongs or surrogates.
  std::uint8_t lo;
  std::uint8_t hi;
};

constexpr auto classify(std::uint8_t b) noexcept -> std::optional<LeadInfo> {
  if (b >= 0xC2 && b <= 0xDF) return LeadInfo{2, 0x80, 0xBF};
  if (b == 0xE0) return LeadInfo{3, 0xA0, 0xBF};
  if (b >= 0xE1 && b <= 0xEC) return LeadInfo{3, 0x80, 0xBF};
  if (b == 0xED) return LeadInfo{3, 0x80, 0x9F};
  if (b >= 0xEE && b <= 0xEF) return LeadInfo{3, 0x80, 0xBF};
  if (b == 0xF0) return LeadInfo{4, 0x90, 0xBF};
  if (b >= 0xF1 && b <= 0xF3) return LeadInfo{4, 0x80, 0xBF};
  if (b == 0xF4) return LeadInfo{4, 0x80, 0x8F};
  return std::nullopt;
}

}  // namespace

auto first_invalid(std::span<const std::uint8_t> bytes) noexcept
    -> std::optional<std::size_t> {
  std::size_t i = 0;
  while (i < bytes.size()) {
    auto b = bytes[i];
    if (b < 0x80) {
      ++i;
      continue;
    }
    auto lead = classify(b);
    if (!lead || i + lead->length > bytes.size()) {
      return i;
    }
    auto second = bytes[i + 1];
    if (second < lead->lo || second > lead->hi) {
      return i;
    }
    for (std::size_t k = 2; k < lead->length; ++k) {
      if (!is_cont(bytes[i + k])) {
        return i;
      }
    }
    i += lead->length;
  }
  return std::nullopt;
}

}  // namespace sipwire::utf8
