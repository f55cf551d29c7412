#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "devbar/features.hpp"
#include "devbar/http-constants.hpp"
#include "devbar/string-equal-ignore-case.hpp"

namespace devbar {

// Content codings known by devbar. 'none' stands for identity and should stay last.
enum class Encoding : std::uint8_t {
  zstd,
  br,
  gzip,
  deflate,
  none,
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

// Get string representation of encoding for use in HTTP headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {
      http::zstd, http::br, http::gzip, http::deflate, http::identity,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Check if encoding is compiled in this build. gzip and deflate are always available.
constexpr bool IsEncodingEnabled(Encoding enc) {
  constexpr bool kEncodingEnabled[kNbContentEncodings] = {
      zstdEnabled(), brotliEnabled(), true, true, true,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return false;
  }
  return kEncodingEnabled[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Maps a content-coding token (case-insensitive) to its Encoding, or nullopt if devbar does not know it.
constexpr std::optional<Encoding> EncodingFromToken(std::string_view token) {
  for (std::underlying_type_t<Encoding> pos = 0; pos < kNbContentEncodings; ++pos) {
    const auto enc = static_cast<Encoding>(pos);
    if (CaseInsensitiveEqual(token, GetEncodingStr(enc))) {
      return enc;
    }
  }
  return std::nullopt;
}

}  // namespace devbar
