#include "devbar/http-header.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "devbar/string-equal-ignore-case.hpp"

namespace devbar::http {

std::optional<std::string_view> FindHeaderValue(const HeaderList &headers, std::string_view name) noexcept {
  const auto it =
      std::ranges::find_if(headers, [name](const Header &hdr) { return CaseInsensitiveEqual(hdr.name, name); });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::string JoinHeaderValues(const HeaderList &headers, std::string_view name) {
  std::string ret;
  for (const Header &hdr : headers) {
    if (!CaseInsensitiveEqual(hdr.name, name)) {
      continue;
    }
    if (!ret.empty()) {
      ret.append(", ");
    }
    ret.append(hdr.value);
  }
  return ret;
}

std::size_t EraseHeaders(HeaderList &headers, std::string_view name) {
  return std::erase_if(headers, [name](const Header &hdr) { return CaseInsensitiveEqual(hdr.name, name); });
}

}  // namespace devbar::http
