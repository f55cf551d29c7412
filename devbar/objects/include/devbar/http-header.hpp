#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devbar::http {

// A header field as declared by the application. Names keep their original case.
struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header &) const = default;
};

// Ordered header fields, duplicates preserved in declaration order.
using HeaderList = std::vector<Header>;

// Value of the first header named 'name' (case-insensitive), nullopt if absent.
std::optional<std::string_view> FindHeaderValue(const HeaderList &headers, std::string_view name) noexcept;

[[nodiscard]] inline bool HasHeader(const HeaderList &headers, std::string_view name) noexcept {
  return FindHeaderValue(headers, name).has_value();
}

// Comma-joined values of all headers named 'name', in declaration order (RFC 9110 §5.3).
std::string JoinHeaderValues(const HeaderList &headers, std::string_view name);

// Removes every header named 'name'. Returns the number of removed fields.
std::size_t EraseHeaders(HeaderList &headers, std::string_view name);

}  // namespace devbar::http
