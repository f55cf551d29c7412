#pragma once

#include <string_view>

#include "devbar/codec-registry.hpp"
#include "devbar/decode-outcome.hpp"
#include "devbar/decoder.hpp"
#include "devbar/encoding-stack.hpp"

namespace devbar {

class DecompressionCascade {
 public:
  // Removes the codings of 'stack' from 'body', last declared first.
  // The whole stack is resolved against 'registry' before anything is decoded: a single unknown or unavailable
  // coding makes it non reversible. Decoding never yields a partially decoded body, any stage failure (malformed
  // data, a stage producing more than limits.maxDecodedBytes) or a result that is not valid UTF-8 gives Failed with
  // the original bytes. An empty stack gives PassThrough.
  static DecodeOutcome Run(const EncodingStack &stack, std::string_view body, const CodecRegistry &registry,
                           DecodeLimits limits);
};

}  // namespace devbar
