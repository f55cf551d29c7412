#pragma once

#include <zstd.h>

#include <string_view>

#include "devbar/encoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

class ZstdEncoder final : public Encoder {
 public:
  // Throws std::invalid_argument if 'level' is outside the range supported by libzstd.
  explicit ZstdEncoder(int level = ZSTD_CLEVEL_DEFAULT);

  [[nodiscard]] Encoding encoding() const noexcept override { return Encoding::zstd; }

  void encode(std::string_view plain, RawChars &out) const override;

 private:
  int _level;
};

}  // namespace devbar
