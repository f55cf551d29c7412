#include "devbar/request-scope.hpp"

#include <cstddef>
#include <string_view>

#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/http-list.hpp"

namespace devbar {

std::string_view RequestScope::host() const noexcept {
  std::string_view host = http::TrimOws(http::FindHeaderValue(headers, http::Host).value_or(std::string_view{}));
  if (host.starts_with('[')) {
    // IPv6 literal, keep brackets
    const std::size_t closing = host.find(']');
    return closing == std::string_view::npos ? host : host.substr(0, closing + 1);
  }
  return host.substr(0, host.find(':'));
}

}  // namespace devbar
