#include "devbar/zlib-encoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string_view>

#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"
#include "devbar/zlib-stream.hpp"

namespace devbar {

void ZlibEncoder::encode(std::string_view plain, RawChars &out) const {
  ZlibStream deflater(_coding, ZlibStream::Direction::deflate, _level);
  z_stream &stream = deflater.get();

  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(plain.data()));
  stream.avail_in = static_cast<uInt>(plain.size());

  // deflateBound is large enough for a single Z_FINISH call
  const auto bound = static_cast<std::size_t>(deflateBound(&stream, static_cast<uLong>(plain.size())));
  out.ensureAvailableCapacity(bound);

  stream.next_out = reinterpret_cast<Bytef *>(out.data() + out.size());
  stream.avail_out = static_cast<uInt>(bound);

  const int ret = deflate(&stream, Z_FINISH);
  if (ret != Z_STREAM_END) {
    throw std::runtime_error(std::format("{} compression failed with error {}", GetEncodingStr(_coding), ret));
  }
  out.addSize(bound - stream.avail_out);
}

}  // namespace devbar
