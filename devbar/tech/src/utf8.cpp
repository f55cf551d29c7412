#include "devbar/utf8.hpp"

#include <cstddef>
#include <string_view>

namespace devbar {

namespace {

constexpr bool IsContinuation(unsigned char ch) noexcept { return (ch & 0xC0U) == 0x80U; }

}  // namespace

bool IsValidUtf8(std::string_view data) noexcept {
  const auto *pos = reinterpret_cast<const unsigned char *>(data.data());
  const auto *end = pos + data.size();

  while (pos != end) {
    const unsigned char lead = *pos;
    if (lead < 0x80U) {
      ++pos;
      continue;
    }

    std::size_t nbContinuations;
    unsigned char secondMin = 0x80U;
    unsigned char secondMax = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
      nbContinuations = 1;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
      nbContinuations = 2;
      if (lead == 0xE0U) {
        secondMin = 0xA0U;  // overlong
      } else if (lead == 0xEDU) {
        secondMax = 0x9FU;  // UTF-16 surrogates
      }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
      nbContinuations = 3;
      if (lead == 0xF0U) {
        secondMin = 0x90U;  // overlong
      } else if (lead == 0xF4U) {
        secondMax = 0x8FU;  // above U+10FFFF
      }
    } else {
      return false;
    }

    if (static_cast<std::size_t>(end - pos) <= nbContinuations) {
      return false;
    }
    if (pos[1] < secondMin || pos[1] > secondMax) {
      return false;
    }
    for (std::size_t idx = 2; idx <= nbContinuations; ++idx) {
      if (!IsContinuation(pos[idx])) {
        return false;
      }
    }
    pos += nbContinuations + 1;
  }
  return true;
}

}  // namespace devbar
