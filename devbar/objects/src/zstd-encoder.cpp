#include "devbar/zstd-encoder.hpp"

#include <zstd.h>

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string_view>

#include "devbar/raw-chars.hpp"

namespace devbar {

ZstdEncoder::ZstdEncoder(int level) : _level(level) {
  if (level < ZSTD_minCLevel() || level > ZSTD_maxCLevel()) {
    throw std::invalid_argument(
        std::format("zstd level {} out of range [{}, {}]", level, ZSTD_minCLevel(), ZSTD_maxCLevel()));
  }
}

void ZstdEncoder::encode(std::string_view plain, RawChars &out) const {
  const std::size_t bound = ZSTD_compressBound(plain.size());
  out.ensureAvailableCapacity(bound);

  const std::size_t written = ZSTD_compress(out.data() + out.size(), bound, plain.data(), plain.size(), _level);
  if (ZSTD_isError(written) != 0U) {
    throw std::runtime_error(std::format("zstd compression failed: {}", ZSTD_getErrorName(written)));
  }
  out.addSize(written);
}

}  // namespace devbar
