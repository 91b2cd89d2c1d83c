#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <string_view>
#include <system_error>
#include <variant>

namespace sipwire {

/// Outcome of one parse attempt over the bytes received so far.
class ParseResult {
public:
  struct Done {
    std::size_t consumed{0};
    auto operator==(const Done&) const -> bool = default;
  };

  struct Incomplete {
    /// Additional bytes known to be required, when that is known.
    std::optional<std::size_t> needed;
    auto operator==(const Incomplete&) const -> bool = default;
  };

  struct Failed {
    std::error_code error;
    /// Offset of the offending byte from the start of the buffer.
    std::size_t offset{0};
    auto operator==(const Failed&) const -> bool = default;
  };

  using State = std::variant<Done, Incomplete, Failed>;

  [[nodiscard]] static auto done(std::size_t consumed) noexcept
      -> ParseResult {
    return ParseResult{Done{consumed}};
  }

  [[nodiscard]] static auto incomplete(
      std::optional<std::size_t> needed = std::nullopt) noexcept
      -> ParseResult {
    return ParseResult{Incomplete{needed}};
  }

  [[nodiscard]] static auto failed(std::error_code error,
                                   std::size_t offset) noexcept
      -> ParseResult {
    return ParseResult{Failed{error, offset}};
  }

  [[nodiscard]] auto is_done() const noexcept -> bool {
    return std::holds_alternative<Done>(state_);
  }

  [[nodiscard]] auto is_incomplete() const noexcept -> bool {
    return std::holds_alternative<Incomplete>(state_);
  }

  [[nodiscard]] auto is_failed() const noexcept -> bool {
    return std::holds_alternative<Failed>(state_);
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return is_done();
  }

  /// Bytes consumed from the start of the buffer; 0 unless done.
  [[nodiscard]] auto consumed() const noexcept -> std::size_t {
    if (const auto* d = std::get_if<Done>(&state_)) {
      return d->consumed;
    }
    return 0;
  }

  [[nodiscard]] auto needed() const noexcept -> std::optional<std::size_t> {
    if (const auto* i = std::get_if<Incomplete>(&state_)) {
      return i->needed;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto error() const noexcept -> std::error_code {
    if (const auto* f = std::get_if<Failed>(&state_)) {
      return f->error;
    }
    return {};
  }

  [[nodiscard]] auto offset() const noexcept -> std::size_t {
    if (const auto* f = std::get_if<Failed>(&state_)) {
      return f->offset;
    }
    return 0;
  }

  [[nodiscard]] auto state() const noexcept -> const State& {
    return state_;
  }

  auto operator==(const ParseResult&) const -> bool = default;

private:
  explicit ParseResult(State state) noexcept : state_(state) {}

  State state_;
};

}  // namespace sipwire

template <>
struct std::formatter<sipwire::ParseResult> : std::formatter<std::string_view> {
  auto format(const sipwire::ParseResult& r, std::format_context& ctx) const {
    if (r.is_done()) {
      return std::format_to(ctx.out(), "done({} bytes)", r.consumed());
    }
    if (r.is_incomplete()) {
      if (auto n = r.needed()) {
        return std::format_to(ctx.out(), "incomplete(+{} bytes)", *n);
      }
      return std::format_to(ctx.out(), "incomplete");
    }
    return std::format_to(ctx.out(), "failed({} at offset {})",
                          r.error().message(), r.offset());
  }
};
