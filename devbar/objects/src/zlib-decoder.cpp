#include "devbar/zlib-decoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <string_view>

#include "decode-output-guard.hpp"
#include "devbar/decoder.hpp"
#include "devbar/encoding.hpp"
#include "devbar/log.hpp"
#include "devbar/raw-chars.hpp"
#include "devbar/zlib-stream.hpp"

namespace devbar {

bool ZlibDecoder::decode(std::string_view encoded, DecodeLimits limits, RawChars &out) const {
  ZlibStream inflater(_coding, ZlibStream::Direction::inflate);
  z_stream &stream = inflater.get();
  const std::string_view name = GetEncodingStr(_coding);

  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(encoded.data()));
  stream.avail_in = static_cast<uInt>(encoded.size());

  DecodeOutputGuard guard(out, limits);
  while (true) {
    const std::size_t room = guard.nextStep();
    stream.next_out = reinterpret_cast<Bytef *>(guard.writePos());
    stream.avail_out = static_cast<uInt>(room);

    const int ret = inflate(&stream, Z_NO_FLUSH);
    guard.commit(room - stream.avail_out);

    if (guard.exceeded()) {
      log::debug("{} body decodes to more than {} bytes", name, guard.maxDecodedBytes());
      return false;
    }
    if (ret == Z_STREAM_END) {
      if (stream.avail_in != 0) {
        log::debug("{} body has {} unexpected bytes after the end of stream", name, stream.avail_in);
        return false;
      }
      return true;
    }
    if (ret != Z_OK && ret != Z_BUF_ERROR) {
      log::debug("inflate of {} body failed with error {}", name, ret);
      return false;
    }
    if (stream.avail_out != 0) {
      // inflate stopped with free output space: it needs input we do not have
      log::debug("{} body is truncated", name);
      return false;
    }
  }
}

}  // namespace devbar
