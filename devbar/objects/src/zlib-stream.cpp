#include "devbar/zlib-stream.hpp"

#include <zlib.h>

#include <format>
#include <stdexcept>

#include "devbar/encoding.hpp"
#include "devbar/log.hpp"

namespace devbar {

namespace {

// zlib selects the wrapper format from the window bits.
int WindowBits(Encoding coding) {
  switch (coding) {
    case Encoding::gzip:
      return MAX_WBITS + 16;
    case Encoding::deflate:
      return MAX_WBITS;
    default:
      throw std::invalid_argument(std::format("'{}' is not a zlib content coding", GetEncodingStr(coding)));
  }
}

}  // namespace

ZlibStream::ZlibStream(Encoding coding, Direction direction, int level) : _coding(coding), _direction(direction) {
  const int windowBits = WindowBits(coding);
  const int ret = direction == Direction::inflate
                      ? inflateInit2(&_stream, windowBits)
                      : deflateInit2(&_stream, level, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(std::format("Unable to initialize zlib stream for {}, error {}", GetEncodingStr(coding),
                                         ret));
  }
}

ZlibStream::~ZlibStream() {
  if (_direction == Direction::inflate) {
    if (inflateEnd(&_stream) != Z_OK) {
      log::error("inflateEnd failed for a {} stream", GetEncodingStr(_coding));
    }
  } else {
    // Z_DATA_ERROR only means the stream was freed before Z_FINISH completed.
    const int ret = deflateEnd(&_stream);
    if (ret != Z_OK && ret != Z_DATA_ERROR) {
      log::error("deflateEnd failed for a {} stream, error {}", GetEncodingStr(_coding), ret);
    }
  }
}

}  // namespace devbar
