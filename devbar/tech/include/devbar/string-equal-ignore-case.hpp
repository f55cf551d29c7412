#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace devbar {

// ASCII-only lower case conversion, locale independent.
constexpr char ToLowerAscii(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char *pLhs = lhs.data();
  const char *pRhs = rhs.data();
  const char *end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (ToLowerAscii(*pLhs) != ToLowerAscii(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Position of the last occurrence of 'needle' in 'haystack' ignoring ASCII case, or npos.
// An empty needle is never found.
constexpr std::size_t RFindCaseInsensitive(std::string_view haystack, std::string_view needle) {
  if (needle.empty() || haystack.size() < needle.size()) {
    return std::string_view::npos;
  }
  for (std::size_t pos = haystack.size() - needle.size() + 1; pos != 0; --pos) {
    if (CaseInsensitiveEqual(haystack.substr(pos - 1, needle.size()), needle)) {
      return pos - 1;
    }
  }
  return std::string_view::npos;
}

inline std::string ToLowerCopy(std::string_view str) {
  std::string ret(str);
  for (char &ch : ret) {
    ch = ToLowerAscii(ch);
  }
  return ret;
}

}  // namespace devbar
