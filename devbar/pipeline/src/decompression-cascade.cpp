#include "devbar/decompression-cascade.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "devbar/codec-registry.hpp"
#include "devbar/decode-outcome.hpp"
#include "devbar/decoder.hpp"
#include "devbar/encoding-stack.hpp"
#include "devbar/encoding.hpp"
#include "devbar/log.hpp"
#include "devbar/raw-chars.hpp"
#include "devbar/utf8.hpp"

namespace devbar {

DecodeOutcome DecompressionCascade::Run(const EncodingStack &stack, std::string_view body,
                                        const CodecRegistry &registry, DecodeLimits limits) {
  if (stack.empty()) {
    return DecodeOutcome::PassThrough(body);
  }

  std::vector<Encoding> stages;
  stages.reserve(stack.size());
  for (const std::string &token : stack.decodeOrder()) {
    const CodecLookup lookup = registry.lookup(token);
    switch (lookup.status) {
      case CodecStatus::unknown:
        log::debug("Unknown content coding '{}', response is passed through", token);
        return DecodeOutcome::Failed(body, "unknown content coding");
      case CodecStatus::unavailable:
        log::debug("Content coding '{}' is not available in this build, response is passed through", token);
        return DecodeOutcome::Failed(body, "content coding not available");
      case CodecStatus::available:
        break;
    }
    stages.push_back(lookup.encoding);
  }

  // Decode in reverse order, stage by stage. The first stage reads the captured body, subsequent ones read the
  // output of the previous stage, alternating between two buffers.
  std::array<RawChars, 2> buffers;
  std::size_t dstPos = 0;
  std::string_view src = body;
  for (const Encoding encoding : stages) {
    RawChars &dst = buffers[dstPos];
    dst.clear();
    if (!registry.decode(encoding, src, limits, dst)) {
      log::debug("Decoding of '{}' failed for a body of {} bytes, response is passed through",
                 GetEncodingStr(encoding), src.size());
      return DecodeOutcome::Failed(body, "malformed or too large encoded body");
    }
    src = dst;
    dstPos ^= 1U;
  }

  if (!IsValidUtf8(src)) {
    log::debug("Decoded body of {} bytes is not valid UTF-8, response is passed through", src.size());
    return DecodeOutcome::Failed(body, "decoded body is not valid UTF-8");
  }

  return DecodeOutcome::Decoded(std::move(buffers[dstPos ^ 1U]));
}

}  // namespace devbar
