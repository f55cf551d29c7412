#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>

#include "devbar/decoder.hpp"
#include "devbar/raw-chars.hpp"

namespace devbar {

// Hands out the output space of successive codec calls, growing geometrically from limits.chunkSize.
// The space never extends more than one byte past limits.maxDecodedBytes: a codec filling that extra byte proves the
// body is too large without decoding the rest of it.
class DecodeOutputGuard {
 public:
  DecodeOutputGuard(RawChars &out, DecodeLimits limits) noexcept
      : _out(out),
        _startSize(out.size()),
        _maxDecodedBytes(limits.maxDecodedBytes == 0 ? kUnbounded : limits.maxDecodedBytes),
        _chunkSize(std::max(limits.chunkSize, std::size_t{1})) {}

  // Reserves the output space of the next codec call and returns its size.
  std::size_t nextStep() {
    const std::size_t decoded = decodedBytes();
    std::size_t room = std::max(_chunkSize, decoded);
    if (_maxDecodedBytes != kUnbounded) {
      room = std::min(room, _maxDecodedBytes - decoded + 1);
    }
    _out.ensureAvailableCapacity(room);
    return room;
  }

  [[nodiscard]] char *writePos() noexcept { return _out.data() + _out.size(); }

  void commit(std::size_t written) { _out.addSize(written); }

  [[nodiscard]] std::size_t decodedBytes() const noexcept { return _out.size() - _startSize; }

  [[nodiscard]] bool exceeded() const noexcept { return decodedBytes() > _maxDecodedBytes; }

  [[nodiscard]] std::size_t maxDecodedBytes() const noexcept { return _maxDecodedBytes; }

 private:
  static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

  RawChars &_out;
  std::size_t _startSize;
  std::size_t _maxDecodedBytes;
  std::size_t _chunkSize;
};

}  // namespace devbar
