#ifndef __NANOGEN_IO_BUFFER_H__
#define __NANOGEN_IO_BUFFER_H__

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <utility>

#include "absl/log/check.h"
#include "absl/types/span.h"
#include "common/utilities.h"

namespace nanogen {
namespace io {

// Manages an owned, preallocated memory buffer. The wrapped memory never moves while the buffer is
// alive, not even when the `Buffer` object itself is moved, so it's safe to keep views into it.
class Buffer {
 public:
  // Constructs an empty `Buffer` object. Nothing is allocated and both size and capacity are 0.
  explicit Buffer() = default;

  // Constructs a Buffer with an allocated `capacity` and initial length 0.
  explicit Buffer(size_t const capacity)
      : capacity_(capacity), length_(0), data_(new uint8_t[capacity_]) {}

  // Allocates a buffer with `size` capacity and length and copies `data` into it. This constructor
  // does not take ownership of `data`.
  explicit Buffer(void const* const data, size_t const size)
      : capacity_(size), length_(size), data_(new uint8_t[size]) {
    if (size > 0) {
      std::memcpy(data_, data, size);
    }
  }

  explicit Buffer(absl::Span<uint8_t const> const bytes)
      : Buffer(bytes.data(), bytes.size()) {}

  ~Buffer() { delete[] data_; }

  Buffer(Buffer&& other) noexcept
      : capacity_(other.capacity_), length_(other.length_), data_(other.Release()) {}

  Buffer& operator=(Buffer&& other) noexcept {
    if (this != &other) {
      delete[] data_;
      capacity_ = other.capacity_;
      length_ = other.length_;
      data_ = other.Release();
    }
    return *this;
  }

  void swap(Buffer& other) noexcept {
    std::swap(capacity_, other.capacity_);
    std::swap(length_, other.length_);
    std::swap(data_, other.data_);
  }

  friend void swap(Buffer& lhs, Buffer& rhs) noexcept { lhs.swap(rhs); }

  size_t capacity() const { return capacity_; }
  size_t size() const { return length_; }
  [[nodiscard]] bool empty() const { return length_ == 0; }

  absl::Span<uint8_t const> span() const { return absl::Span<uint8_t const>(data_, length_); }

  uint8_t* as_byte_array() { return data_; }
  uint8_t const* as_byte_array() const { return data_; }

  char* as_char_array() { return reinterpret_cast<char*>(data_); }
  char const* as_char_array() const { return reinterpret_cast<char const*>(data_); }

  // Appends the provided `word` to the buffer in host byte order. Check-fails in case of overflow,
  // i.e. if `size() + sizeof(Word) > capacity()`.
  template <typename Word, std::enable_if_t<std::is_arithmetic_v<Word>, bool> = true>
  Buffer& Append(Word const word) {
    CHECK_LE(length_ + sizeof(Word), capacity_) << "buffer overflow";
    std::memcpy(data_ + length_, &word, sizeof(Word));
    length_ += sizeof(Word);
    return *this;
  }

  // Copies the entire content of `other` to the end of this buffer. Check-fails if this buffer
  // doesn't have enough capacity.
  Buffer& Append(Buffer const& other) {
    CHECK_LE(length_ + other.length_, capacity_) << "buffer overflow";
    if (other.length_ > 0) {
      std::memcpy(data_ + length_, other.data_, other.length_);
    }
    length_ += other.length_;
    return *this;
  }

  // Increments the size by the specified amount after writing to `as_byte_array()` directly.
  // Check-fails if the resulting size is greater than the capacity.
  void Advance(size_t const delta) {
    length_ += delta;
    CHECK_LE(length_, capacity_) << "buffer overflow";
  }

  // Copies `length` bytes from `source` into the buffer, advancing the size of the buffer
  // accordingly. Check-fails if the buffer capacity would be exceeded.
  void MemCpy(void const* const source, size_t const length) {
    CHECK_LE(length_ + length, capacity_) << "buffer overflow";
    if (length > 0) {
      std::memcpy(data_ + length_, source, length);
    }
    length_ += length;
  }

  // Releases ownership of the buffer, invalidating this object and returning a pointer to the
  // previously wrapped data.
  gsl::owner<uint8_t*> Release() {
    gsl::owner<uint8_t*> const data = data_;
    capacity_ = 0;
    length_ = 0;
    data_ = nullptr;
    return data;
  }

 private:
  // Copies are forbidden because they are potentially expensive.
  Buffer(Buffer const&) = delete;
  Buffer& operator=(Buffer const&) = delete;

  size_t capacity_ = 0;
  size_t length_ = 0;
  gsl::owner<uint8_t*> data_ = nullptr;
};

}  // namespace io
}  // namespace nanogen

#endif  // __NANOGEN_IO_BUFFER_H__
