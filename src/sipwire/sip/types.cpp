#include "sipwire/sip/types.hpp"

#include <algorithm>
#include <cctype>

namespace sipwire {
namespace {

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  return std::ranges::equal(a, b, [](char ca, char cb) {
    return std::tolower(static_cast<unsigned char>(ca)) ==
           std::tolower(static_cast<unsigned char>(cb));
  });
}

}  // namespace

auto HeaderList::find(std::string_view name) const noexcept
    -> std::optional<Header> {
  auto headers = view();
  auto it = std::ranges::find_if(
      headers, [&](const Header& h) { return iequals(h.name, name); });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return *it;
}

}  // namespace sipwire
