#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>

namespace devbar {

/**
 * A simple growable character buffer exposing its spare capacity.
 * It is designed to be used by compression libraries (gzip, brotli, zstd) that write directly into raw memory.
 * Do not use it for general-purpose data storage (prefer std::string in that case).
 */
class RawChars {
 public:
  using value_type = char;
  using size_type = std::size_t;
  using pointer = char *;
  using const_pointer = const char *;
  using iterator = char *;
  using const_iterator = const char *;

  RawChars() noexcept = default;

  explicit RawChars(size_type capacity);

  explicit RawChars(std::string_view data);

  RawChars(const RawChars &rhs);
  RawChars(RawChars &&rhs) noexcept;

  RawChars &operator=(const RawChars &rhs);
  RawChars &operator=(RawChars &&rhs) noexcept;

  ~RawChars();

  void unchecked_append(std::string_view data);

  void append(std::string_view data);

  void assign(std::string_view data);

  void clear() noexcept { _size = 0; }

  void setSize(size_type newSize);

  void addSize(size_type delta);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  // Grows capacity to at least twice the current one.
  void reserveExponential(size_type newCapacity);

  void ensureAvailableCapacity(size_type availableCapacity);

  void ensureAvailableCapacityExponential(size_type availableCapacity);

  // Releases the memory, leaving an empty buffer without capacity.
  void release() noexcept;

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  void swap(RawChars &rhs) noexcept;

  operator std::string_view() const noexcept { return {_buf, _size}; }

  bool operator==(const RawChars &rhs) const noexcept;

  using trivially_relocatable = std::true_type;

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawChars &lhs, RawChars &rhs) noexcept { lhs.swap(rhs); }

}  // namespace devbar
