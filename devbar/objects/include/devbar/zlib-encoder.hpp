#pragma once

#include <zlib.h>

#include <string_view>

#include "devbar/encoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

class ZlibEncoder final : public Encoder {
 public:
  // 'coding' is Encoding::gzip or Encoding::deflate.
  explicit ZlibEncoder(Encoding coding, int level = Z_DEFAULT_COMPRESSION) noexcept : _coding(coding), _level(level) {}

  [[nodiscard]] Encoding encoding() const noexcept override { return _coding; }

  void encode(std::string_view plain, RawChars &out) const override;

 private:
  Encoding _coding;
  int _level;
};

}  // namespace devbar
