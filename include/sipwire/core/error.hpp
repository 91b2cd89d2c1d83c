#pragma once

#include <concepts>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace sipwire {

enum class Error : int {
  Success,
  NewLine,
  Token,
  Delimiter,
  HeaderValue,
  Encoding,
  Version,
  Status,
  TooManyHeaders,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  InvalidArgument,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "expected CRLF line ending",
      "invalid byte where a token is required",
      "missing delimiter",
      "invalid byte in header value",
      "malformed UTF-8 text",
      "invalid SIP version",
      "invalid status code",
      "too many headers",
      "file not found",
      "failed to open file",
      "parse error",
      "invalid argument",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "sipwire";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace sipwire

template <>
struct std::is_error_code_enum<sipwire::Error> : std::true_type {};
