#pragma once

#include <brotli/encode.h>

#include <string_view>

#include "devbar/encoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

class BrotliEncoder final : public Encoder {
 public:
  explicit BrotliEncoder(int quality = BROTLI_DEFAULT_QUALITY) noexcept : _quality(quality) {}

  [[nodiscard]] Encoding encoding() const noexcept override { return Encoding::br; }

  void encode(std::string_view plain, RawChars &out) const override;

 private:
  int _quality;
};

}  // namespace devbar
