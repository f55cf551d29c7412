#pragma once

#include <cstdint>
#include <string_view>

namespace devbar::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// HTTP header field names are case-insensitive per RFC 7230. We store them here in their conventional canonical
// form for emission, comparisons must go through CaseInsensitiveEqual. Coding tokens are kept lowercase.

using StatusCode = std::uint16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodeNotModified = 304;
inline constexpr StatusCode StatusCodeInternalServerError = 500;

// Request methods are case-sensitive (RFC 9110 §9.1)
inline constexpr std::string_view MethodHead = "HEAD";

// Header field names
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ServerTiming = "Server-Timing";
inline constexpr std::string_view Host = "Host";

inline constexpr std::string_view HeaderSep = ": ";

// Content codings
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view deflate = "deflate";
inline constexpr std::string_view zstd = "zstd";  // RFC 8878
inline constexpr std::string_view br = "br";      // RFC 7932 (Brotli)

// Content types
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationXhtml = "application/xhtml+xml";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// RFC 9110 §6.4.1: 1xx, 204 and 304 responses never carry content.
constexpr bool StatusHasNoBody(StatusCode status) noexcept {
  return status < 200 || status == StatusCodeNoContent || status == StatusCodeNotModified;
}

}  // namespace devbar::http
