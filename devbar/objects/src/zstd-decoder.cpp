#include "devbar/zstd-decoder.hpp"

#include <zstd.h>

#include <cstddef>
#include <memory>
#include <new>
#include <string_view>

#include "decode-output-guard.hpp"
#include "devbar/decoder.hpp"
#include "devbar/log.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

bool ZstdDecoder::decode(std::string_view encoded, DecodeLimits limits, RawChars &out) const {
  const std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx(ZSTD_createDCtx(), &ZSTD_freeDCtx);
  if (!dctx) {
    throw std::bad_alloc();
  }

  ZSTD_inBuffer input{encoded.data(), encoded.size(), 0};
  DecodeOutputGuard guard(out, limits);
  while (true) {
    const std::size_t room = guard.nextStep();
    ZSTD_outBuffer output{guard.writePos(), room, 0};

    const std::size_t ret = ZSTD_decompressStream(dctx.get(), &output, &input);
    if (ZSTD_isError(ret) != 0U) {
      log::debug("zstd body is malformed: {}", ZSTD_getErrorName(ret));
      return false;
    }
    guard.commit(output.pos);

    if (guard.exceeded()) {
      log::debug("zstd body decodes to more than {} bytes", guard.maxDecodedBytes());
      return false;
    }
    if (input.pos == input.size) {
      if (ret == 0) {
        return true;
      }
      if (output.pos < output.size) {
        // the current frame is not complete and there is no more input
        log::debug("zstd body is truncated");
        return false;
      }
    }
    // ret == 0 with remaining input: the next frame starts
  }
}

}  // namespace devbar
