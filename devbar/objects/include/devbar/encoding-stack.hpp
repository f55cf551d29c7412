#pragma once

#include <cstddef>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/http-header.hpp"

namespace devbar {

// Content codings of a response as declared by its Content-Encoding header(s).
// Tokens are kept in declaration order (the order in which the origin applied them), lower-cased, without
// 'identity' and without empty tokens. Decoding must walk them in reverse order, see decodeOrder().
class EncodingStack {
 public:
  EncodingStack() noexcept = default;

  // Parses a single Content-Encoding value such as "gzip, identity".
  static EncodingStack Parse(std::string_view headerValue);

  // Parses all Content-Encoding fields of 'headers', in declaration order.
  static EncodingStack FromHeaders(const http::HeaderList &headers);

  [[nodiscard]] std::span<const std::string> tokens() const noexcept { return _tokens; }

  // Tokens in the order they have to be removed (last applied first).
  [[nodiscard]] auto decodeOrder() const noexcept { return std::views::reverse(_tokens); }

  [[nodiscard]] bool empty() const noexcept { return _tokens.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _tokens.size(); }

  bool operator==(const EncodingStack &) const = default;

 private:
  std::vector<std::string> _tokens;
};

}  // namespace devbar
