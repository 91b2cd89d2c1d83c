#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string_view>

namespace sipwire {

/// Borrowed input buffer. Every parsed field is a view into it.
using Bytes = std::span<const std::uint8_t>;

[[nodiscard]] inline auto as_bytes(std::string_view s) noexcept -> Bytes {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

[[nodiscard]] inline auto as_text(Bytes b) noexcept -> std::string_view {
  return {reinterpret_cast<const char*>(b.data()), b.size()};
}

/// SIP-Version as written in `SIP/<major>.<minor>`, one digit each.
struct SipVersion {
  std::uint8_t major_version{0};
  std::uint8_t minor_version{0};

  auto operator==(const SipVersion&) const -> bool = default;
};

struct Header {
  /// Always token characters, so safe to read as text.
  std::string_view name;
  /// Raw value bytes. May contain non-ASCII bytes and folded line breaks.
  Bytes value;

  [[nodiscard]] auto value_text() const noexcept -> std::string_view {
    return as_text(value);
  }
};

inline constexpr Header kEmptyHeader{};

class HeaderScanner;

/// Caller-owned header slots plus the number of slots holding parsed data.
///
/// Only the valid prefix is visible through size(), iteration and view().
/// The parser never writes beyond capacity().
class HeaderList {
public:
  explicit HeaderList(std::span<Header> slots) noexcept : slots_(slots) {}

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return slots_.size();
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return len_;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return len_ == 0;
  }

  /// Requires i < size().
  [[nodiscard]] auto operator[](std::size_t i) const noexcept
      -> const Header& {
    return view()[i];
  }

  /// Header at i, or nullopt when i is past the valid prefix.
  [[nodiscard]] auto at(std::size_t i) const noexcept
      -> std::optional<Header> {
    if (i >= len_) {
      return std::nullopt;
    }
    return slots_[i];
  }

  [[nodiscard]] auto view() const noexcept -> std::span<const Header> {
    return slots_.first(len_);
  }

  [[nodiscard]] auto begin() const noexcept {
    return view().begin();
  }

  [[nodiscard]] auto end() const noexcept {
    return view().end();
  }

  /// First header whose name matches case-insensitively.
  [[nodiscard]] auto find(std::string_view name) const noexcept
      -> std::optional<Header>;

  auto clear() noexcept -> void {
    len_ = 0;
  }

private:
  friend class HeaderScanner;

  std::span<Header> slots_;
  std::size_t len_{0};
};

}  // namespace sipwire

template <>
struct std::formatter<sipwire::SipVersion> : std::formatter<std::string_view> {
  auto format(const sipwire::SipVersion& v, std::format_context& ctx) const {
    return std::format_to(ctx.out(), "SIP/{}.{}", v.major_version,
                          v.minor_version);
  }
};
