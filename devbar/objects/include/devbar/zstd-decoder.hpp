#pragma once

#include <string_view>

#include "devbar/decoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

// Decodes one or more concatenated zstd frames. Frames without a declared content size are supported.
class ZstdDecoder final : public Decoder {
 public:
  [[nodiscard]] Encoding encoding() const noexcept override { return Encoding::zstd; }

  [[nodiscard]] bool decode(std::string_view encoded, DecodeLimits limits, RawChars &out) const override;
};

}  // namespace devbar
