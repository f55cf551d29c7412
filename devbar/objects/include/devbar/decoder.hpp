#pragma once

#include <cstddef>
#include <string_view>

#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

// Output bounds of one decoding stage.
struct DecodeLimits {
  // Maximum number of bytes the stage may produce. 0 means unbounded.
  std::size_t maxDecodedBytes{};

  // Minimal growth of the output buffer between two codec calls.
  std::size_t chunkSize{32UL * 1024UL};
};

// Reverses one content coding of a complete response body.
// Each call owns its codec state, so a single decoder can serve concurrent requests.
class Decoder {
 public:
  virtual ~Decoder() = default;

  [[nodiscard]] virtual Encoding encoding() const noexcept = 0;

  // Appends the decoded form of 'encoded' to 'out'.
  // Returns false if 'encoded' is malformed, truncated, followed by extra bytes or decodes to more than
  // limits.maxDecodedBytes. 'out' may then hold a partial result.
  [[nodiscard]] virtual bool decode(std::string_view encoded, DecodeLimits limits, RawChars &out) const = 0;
};

}  // namespace devbar
