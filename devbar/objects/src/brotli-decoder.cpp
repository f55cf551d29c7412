#include "devbar/brotli-decoder.hpp"

#include <brotli/decode.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <string_view>

#include "decode-output-guard.hpp"
#include "devbar/decoder.hpp"
#include "devbar/log.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

bool BrotliDecoder::decode(std::string_view encoded, DecodeLimits limits, RawChars &out) const {
  const std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state(
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
  if (!state) {
    throw std::bad_alloc();
  }

  const auto *nextIn = reinterpret_cast<const std::uint8_t *>(encoded.data());
  std::size_t availIn = encoded.size();

  DecodeOutputGuard guard(out, limits);
  while (true) {
    const std::size_t room = guard.nextStep();
    auto *nextOut = reinterpret_cast<std::uint8_t *>(guard.writePos());
    std::size_t availOut = room;

    const auto res = BrotliDecoderDecompressStream(state.get(), &availIn, &nextIn, &availOut, &nextOut, nullptr);
    if (res == BROTLI_DECODER_RESULT_ERROR) {
      log::debug("br body is malformed: {}", BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
      return false;
    }
    guard.commit(room - availOut);

    if (guard.exceeded()) {
      log::debug("br body decodes to more than {} bytes", guard.maxDecodedBytes());
      return false;
    }
    switch (res) {
      case BROTLI_DECODER_RESULT_SUCCESS:
        if (availIn != 0) {
          log::debug("br body has {} unexpected bytes after the end of stream", availIn);
          return false;
        }
        return true;
      case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
        log::debug("br body is truncated");
        return false;
      default:
        // BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT
        break;
    }
  }
}

}  // namespace devbar
