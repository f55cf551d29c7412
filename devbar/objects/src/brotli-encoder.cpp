#include "devbar/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "devbar/raw-chars.hpp"

namespace devbar {

void BrotliEncoder::encode(std::string_view plain, RawChars &out) const {
  std::size_t encodedSize = BrotliEncoderMaxCompressedSize(plain.size());
  if (encodedSize == 0) {
    throw std::runtime_error("Body too large for br compression");
  }
  out.ensureAvailableCapacity(encodedSize);

  // HTML is the only content devbar deals with, hence the text mode
  if (BrotliEncoderCompress(_quality, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_TEXT, plain.size(),
                            reinterpret_cast<const std::uint8_t *>(plain.data()), &encodedSize,
                            reinterpret_cast<std::uint8_t *>(out.data() + out.size())) == BROTLI_FALSE) {
    throw std::runtime_error("br compression failed");
  }
  out.addSize(encodedSize);
}

}  // namespace devbar
