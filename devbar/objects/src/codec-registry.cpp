#include "devbar/codec-registry.hpp"

#include <format>
#include <initializer_list>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "devbar/decoder.hpp"
#include "devbar/encoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"
#include "devbar/zlib-decoder.hpp"
#include "devbar/zlib-encoder.hpp"

#ifdef DEVBAR_ENABLE_BROTLI
#include "devbar/brotli-decoder.hpp"
#include "devbar/brotli-encoder.hpp"
#endif

#ifdef DEVBAR_ENABLE_ZSTD
#include "devbar/zstd-decoder.hpp"
#include "devbar/zstd-encoder.hpp"
#endif

namespace devbar {

namespace {

constexpr auto Index(Encoding encoding) { return static_cast<std::underlying_type_t<Encoding>>(encoding); }

[[noreturn]] void ThrowUnavailable(Encoding encoding) {
  throw std::invalid_argument(std::format("Content coding '{}' is not available", GetEncodingStr(encoding)));
}

// Codecs keep no state between calls, one shared instance per coding is enough.
const Decoder *FindDecoder(Encoding encoding) noexcept {
  static const ZlibDecoder kGzipDecoder(Encoding::gzip);
  static const ZlibDecoder kDeflateDecoder(Encoding::deflate);
#ifdef DEVBAR_ENABLE_BROTLI
  static const BrotliDecoder kBrotliDecoder;
#endif
#ifdef DEVBAR_ENABLE_ZSTD
  static const ZstdDecoder kZstdDecoder;
#endif
  switch (encoding) {
    case Encoding::gzip:
      return &kGzipDecoder;
    case Encoding::deflate:
      return &kDeflateDecoder;
#ifdef DEVBAR_ENABLE_BROTLI
    case Encoding::br:
      return &kBrotliDecoder;
#endif
#ifdef DEVBAR_ENABLE_ZSTD
    case Encoding::zstd:
      return &kZstdDecoder;
#endif
    default:
      return nullptr;
  }
}

const Encoder *FindEncoder(Encoding encoding) {
  static const ZlibEncoder kGzipEncoder(Encoding::gzip);
  static const ZlibEncoder kDeflateEncoder(Encoding::deflate);
#ifdef DEVBAR_ENABLE_BROTLI
  static const BrotliEncoder kBrotliEncoder;
#endif
#ifdef DEVBAR_ENABLE_ZSTD
  static const ZstdEncoder kZstdEncoder;
#endif
  switch (encoding) {
    case Encoding::gzip:
      return &kGzipEncoder;
    case Encoding::deflate:
      return &kDeflateEncoder;
#ifdef DEVBAR_ENABLE_BROTLI
    case Encoding::br:
      return &kBrotliEncoder;
#endif
#ifdef DEVBAR_ENABLE_ZSTD
    case Encoding::zstd:
      return &kZstdEncoder;
#endif
    default:
      return nullptr;
  }
}

}  // namespace

CodecRegistry::CodecRegistry() noexcept {
  for (std::underlying_type_t<Encoding> pos = 0; pos < kNbContentEncodings; ++pos) {
    _available[pos] = IsEncodingEnabled(static_cast<Encoding>(pos));
  }
}

CodecRegistry::CodecRegistry(std::initializer_list<Encoding> disabled) noexcept : CodecRegistry() {
  for (Encoding encoding : disabled) {
    if (encoding != Encoding::none && Index(encoding) < kNbContentEncodings) {
      _available[Index(encoding)] = false;
    }
  }
}

const CodecRegistry &CodecRegistry::Global() noexcept {
  static const CodecRegistry kRegistry;
  return kRegistry;
}

CodecLookup CodecRegistry::lookup(std::string_view token) const noexcept {
  const auto encoding = EncodingFromToken(token);
  if (!encoding) {
    return {};
  }
  return {.status = isAvailable(*encoding) ? CodecStatus::available : CodecStatus::unavailable,
          .encoding = *encoding};
}

bool CodecRegistry::isAvailable(Encoding encoding) const noexcept {
  return Index(encoding) < kNbContentEncodings && _available[Index(encoding)];
}

bool CodecRegistry::decode(Encoding encoding, std::string_view input, DecodeLimits limits, RawChars &out) const {
  if (!isAvailable(encoding)) {
    ThrowUnavailable(encoding);
  }
  if (encoding == Encoding::none) {
    if (limits.maxDecodedBytes != 0 && input.size() > limits.maxDecodedBytes) {
      return false;
    }
    out.append(input);
    return true;
  }
  const Decoder *pDecoder = FindDecoder(encoding);
  if (pDecoder == nullptr) {
    ThrowUnavailable(encoding);
  }
  return pDecoder->decode(input, limits, out);
}

void CodecRegistry::encode(Encoding encoding, std::string_view input, RawChars &out) const {
  if (!isAvailable(encoding)) {
    ThrowUnavailable(encoding);
  }
  if (encoding == Encoding::none) {
    out.append(input);
    return;
  }
  const Encoder *pEncoder = FindEncoder(encoding);
  if (pEncoder == nullptr) {
    ThrowUnavailable(encoding);
  }
  pEncoder->encode(input, out);
}

}  // namespace devbar
