#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string_view>

#include "devbar/decoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

enum class CodecStatus : std::uint8_t {
  unknown,      // token is not a content coding devbar knows about
  unavailable,  // known coding whose library is not part of this build (or disabled)
  available,
};

struct CodecLookup {
  CodecStatus status{CodecStatus::unknown};
  Encoding encoding{Encoding::none};
};

// Maps content-coding tokens to decode / encode functions and reports their availability.
// The global instance is built once from the build features and never modified afterwards, so it can be shared
// between requests without synchronization.
class CodecRegistry {
 public:
  // Registry reflecting exactly the codecs compiled in this build.
  CodecRegistry() noexcept;

  // Registry where the given encodings are reported unavailable even if compiled in.
  explicit CodecRegistry(std::initializer_list<Encoding> disabled) noexcept;

  static const CodecRegistry &Global() noexcept;

  // Case-insensitive lookup of a single token. 'identity' is reported as available Encoding::none.
  [[nodiscard]] CodecLookup lookup(std::string_view token) const noexcept;

  [[nodiscard]] bool isAvailable(Encoding encoding) const noexcept;

  // Decodes one coding stage of 'input', appending plain bytes to 'out'.
  // Returns false on malformed input or when more than limits.maxDecodedBytes would be produced.
  // Throws std::invalid_argument if 'encoding' is not available.
  [[nodiscard]] bool decode(Encoding encoding, std::string_view input, DecodeLimits limits, RawChars &out) const;

  // Appends the 'encoding' form of 'input' to 'out'.
  // Throws std::invalid_argument if 'encoding' is not available, std::runtime_error on codec failure.
  void encode(Encoding encoding, std::string_view input, RawChars &out) const;

 private:
  std::array<bool, kNbContentEncodings> _available{};
};

}  // namespace devbar
