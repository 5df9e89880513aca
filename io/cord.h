#ifndef __NANOGEN_IO_CORD_H__
#define __NANOGEN_IO_CORD_H__

#include <cstddef>
#include <utility>

#include "absl/container/inlined_vector.h"
#include "io/buffer.h"

namespace nanogen {
namespace io {

// Accumulates owned buffers without copying them. The encoder emits one small buffer per wire
// primitive and `ReadAll` one buffer per read; both join the pieces once with `Flatten`.
class Cord {
 public:
  explicit Cord() = default;
  ~Cord() = default;

  Cord(Cord&& other) noexcept
      : pieces_(std::move(other.pieces_)), size_(std::exchange(other.size_, 0)) {
    other.pieces_.clear();
  }

  Cord& operator=(Cord&& other) noexcept {
    if (this != &other) {
      pieces_ = std::move(other.pieces_);
      other.pieces_.clear();
      size_ = std::exchange(other.size_, 0);
    }
    return *this;
  }

  [[nodiscard]] bool empty() const { return size_ == 0; }

  // Total number of bytes across all pieces.
  size_t size() const { return size_; }

  // Takes ownership of `buffer`. Empty buffers are dropped.
  void Append(Buffer buffer);

  // Returns the concatenation of all pieces. A single piece is returned as is, without copying.
  Buffer Flatten() &&;

 private:
  Cord(Cord const&) = delete;
  Cord& operator=(Cord const&) = delete;

  absl::InlinedVector<Buffer, 1> pieces_;
  size_t size_ = 0;
};

}  // namespace io
}  // namespace nanogen

#endif  // __NANOGEN_IO_CORD_H__
