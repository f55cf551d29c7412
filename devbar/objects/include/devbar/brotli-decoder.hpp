#pragma once

#include <string_view>

#include "devbar/decoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

class BrotliDecoder final : public Decoder {
 public:
  [[nodiscard]] Encoding encoding() const noexcept override { return Encoding::br; }

  [[nodiscard]] bool decode(std::string_view encoded, DecodeLimits limits, RawChars &out) const override;
};

}  // namespace devbar
