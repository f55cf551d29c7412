#pragma once

#include <zlib.h>

#include <cstdint>

#include "devbar/encoding.hpp"

namespace devbar {

// Owns a z_stream initialized for the 'gzip' (RFC 1952) or 'deflate' (RFC 1950) content coding.
class ZlibStream {
 public:
  enum class Direction : std::uint8_t { inflate, deflate };

  // Throws std::invalid_argument if 'coding' is not gzip nor deflate, std::runtime_error if zlib fails to initialize.
  ZlibStream(Encoding coding, Direction direction, int level = Z_DEFAULT_COMPRESSION);

  ZlibStream(const ZlibStream &) = delete;
  ZlibStream(ZlibStream &&) noexcept = delete;
  ZlibStream &operator=(const ZlibStream &) = delete;
  ZlibStream &operator=(ZlibStream &&) noexcept = delete;

  ~ZlibStream();

  [[nodiscard]] z_stream &get() noexcept { return _stream; }

  [[nodiscard]] Encoding coding() const noexcept { return _coding; }

 private:
  z_stream _stream{};
  Encoding _coding;
  Direction _direction;
};

}  // namespace devbar
