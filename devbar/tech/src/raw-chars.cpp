#include "devbar/raw-chars.hpp"

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <string_view>
#include <utility>

namespace devbar {

RawChars::RawChars(size_type capacity) : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawChars::RawChars(std::string_view data) : RawChars(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawChars::RawChars(const RawChars &rhs) : RawChars(std::string_view(rhs)) {}

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(const RawChars &rhs) {
  if (this != &rhs) {
    assign(rhs);
  }
  return *this;
}

RawChars &RawChars::operator=(RawChars &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::unchecked_append(std::string_view data) {
  if (!data.empty()) {
    assert(data.size() <= availableCapacity());
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void RawChars::append(std::string_view data) {
  ensureAvailableCapacityExponential(data.size());
  unchecked_append(data);
}

void RawChars::assign(std::string_view data) {
  reserveExponential(data.size());
  if (!data.empty()) {
    std::memmove(_buf, data.data(), data.size());
  }
  _size = data.size();
}

void RawChars::setSize(size_type newSize) {
  assert(newSize <= _capacity);
  _size = newSize;
}

void RawChars::addSize(size_type delta) {
  assert(_size + delta <= _capacity);
  _size += delta;
}

void RawChars::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::reserveExponential(size_type newCapacity) {
  if (_capacity < newCapacity) {
    if (_capacity > (std::numeric_limits<size_type>::max() - 1U) / 2U) {
      throw std::bad_alloc();
    }
    const size_type doubledCapacity = (_capacity * 2U) + 1U;
    if (newCapacity < doubledCapacity) {
      newCapacity = doubledCapacity;
    }
    reallocUp(newCapacity);
  }
}

void RawChars::ensureAvailableCapacity(size_type availableCapacity) {
  if (std::numeric_limits<size_type>::max() - _size < availableCapacity) {
    throw std::bad_alloc();
  }
  reserve(_size + availableCapacity);
}

void RawChars::ensureAvailableCapacityExponential(size_type availableCapacity) {
  if (std::numeric_limits<size_type>::max() - _size < availableCapacity) {
    throw std::bad_alloc();
  }
  reserveExponential(_size + availableCapacity);
}

void RawChars::release() noexcept {
  std::free(_buf);
  _buf = nullptr;
  _size = 0;
  _capacity = 0;
}

void RawChars::swap(RawChars &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

bool RawChars::operator==(const RawChars &rhs) const noexcept {
  return std::string_view(*this) == std::string_view(rhs);
}

void RawChars::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace devbar
