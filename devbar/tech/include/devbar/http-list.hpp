#pragma once

#include <cstddef>
#include <string_view>

namespace devbar::http {

// Strips OWS (SP and HTAB, RFC 9110 section 5.6.3) from both ends of 'value'.
constexpr std::string_view TrimOws(std::string_view value) noexcept {
  constexpr std::string_view kOws = " \t";
  const std::size_t first = value.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  return value.substr(first, value.find_last_not_of(kOws) + 1 - first);
}

// Removes the first element of the 'sep' separated 'list' and returns it without OWS.
// Empty elements (doubled separators) are returned as empty views, 'list' is empty after the last element.
constexpr std::string_view PopListElement(std::string_view &list, char sep = ',') noexcept {
  const std::size_t sepPos = list.find(sep);
  const std::string_view element = TrimOws(list.substr(0, sepPos));
  list.remove_prefix(sepPos == std::string_view::npos ? list.size() : sepPos + 1);
  return element;
}

}  // namespace devbar::http
