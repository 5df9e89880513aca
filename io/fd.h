#ifndef __NANOGEN_IO_FD_H__
#define __NANOGEN_IO_FD_H__

#include <unistd.h>

#include <utility>

namespace nanogen {
namespace io {

// Owns a Unix file descriptor and closes it upon destruction. Negative numbers mean "no
// descriptor", which is also the state of a moved-from `FD`.
class FD {
 public:
  explicit FD(int const fd) : fd_(fd) {}

  ~FD() { Close(); }

  FD(FD&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

  FD& operator=(FD&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  [[nodiscard]] bool empty() const { return fd_ < 0; }

  // Undefined behavior if empty.
  int operator*() const { return fd_; }

  // No-op if already empty.
  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  FD(FD const&) = delete;
  FD& operator=(FD const&) = delete;

  int fd_;
};

}  // namespace io
}  // namespace nanogen

#endif  // __NANOGEN_IO_FD_H__
