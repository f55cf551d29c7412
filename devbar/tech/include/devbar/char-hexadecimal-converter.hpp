#pragma once

namespace devbar {

/// Writes to 'buf' the 2-char lower case hexadecimal code of given byte 'ch'.
/// Given buffer should have space for at least two chars.
/// Return a pointer to the char immediately positioned after the written hexadecimal code.
/// Examples:
///  0x2c -> "2c"
///  0xff -> "ff"
constexpr char *to_lower_hex(unsigned char ch, char *buf) {
  constexpr const char *const kHexits = "0123456789abcdef";

  buf[0] = kHexits[ch >> 4U];
  buf[1] = kHexits[ch & 0x0F];

  return buf + 2;
}

}  // namespace devbar
