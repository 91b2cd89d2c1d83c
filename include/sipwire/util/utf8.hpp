#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace sipwire::utf8 {

/// Offset of the first byte that starts an ill-formed UTF-8 sequence
/// (RFC 3629), or nullopt if the whole span is well formed.
[[nodiscard]] auto first_invalid(std::span<const std::uint8_t> bytes) noexcept
    -> std::optional<std::size_t>;

[[nodiscard]] inline auto is_valid(std::span<const std::uint8_t> bytes) noexcept
    -> bool {
  return !first_invalid(bytes).has_value();
}

}  // namespace sipwire::utf8
