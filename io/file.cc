#include "io/file.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstddef>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "io/buffer.h"
#include "io/cord.h"
#include "io/fd.h"

namespace nanogen {
namespace io {

namespace {

size_t constexpr kReadChunkSize = 4096;

}  // namespace

absl::StatusOr<FD> OpenForReading(std::string const& path) {
  FD fd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
  if (fd.empty()) {
    return absl::ErrnoToStatus(errno, "open");
  }
  return std::move(fd);
}

absl::StatusOr<FD> DuplicateStdin() {
  FD fd{::dup(STDIN_FILENO)};
  if (fd.empty()) {
    return absl::ErrnoToStatus(errno, "dup");
  }
  return std::move(fd);
}

absl::StatusOr<Buffer> ReadAll(FD const& fd) {
  Cord cord;
  while (true) {
    Buffer chunk{kReadChunkSize};
    ssize_t const result = ::read(*fd, chunk.as_byte_array(), chunk.capacity());
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::ErrnoToStatus(errno, "read");
    }
    if (result == 0) {
      break;
    }
    chunk.Advance(result);
    cord.Append(std::move(chunk));
  }
  return std::move(cord).Flatten();
}

}  // namespace io
}  // namespace nanogen
