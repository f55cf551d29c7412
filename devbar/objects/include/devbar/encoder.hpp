#pragma once

#include <string_view>

#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

// Applies one content coding to a complete body. devbar never re-encodes the responses it rewrites, encoders
// exist for the applications and tests producing compressed content.
class Encoder {
 public:
  virtual ~Encoder() = default;

  [[nodiscard]] virtual Encoding encoding() const noexcept = 0;

  // Appends the encoded form of 'plain' to 'out'. Throws std::runtime_error on codec failure.
  virtual void encode(std::string_view plain, RawChars &out) const = 0;
};

}  // namespace devbar
