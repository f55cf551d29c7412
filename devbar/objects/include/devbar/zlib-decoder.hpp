#pragma once

#include <string_view>

#include "devbar/decoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

// Inflates 'gzip' or 'deflate' bodies. Only the first gzip member is accepted, any byte after it is an error.
class ZlibDecoder final : public Decoder {
 public:
  // 'coding' is Encoding::gzip or Encoding::deflate.
  explicit ZlibDecoder(Encoding coding) noexcept : _coding(coding) {}

  [[nodiscard]] Encoding encoding() const noexcept override { return _coding; }

  [[nodiscard]] bool decode(std::string_view encoded, DecodeLimits limits, RawChars &out) const override;

 private:
  Encoding _coding;
};

}  // namespace devbar
