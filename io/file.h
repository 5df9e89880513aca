#ifndef __NANOGEN_IO_FILE_H__
#define __NANOGEN_IO_FILE_H__

#include <string>

#include "absl/status/statusor.h"
#include "io/buffer.h"
#include "io/fd.h"

namespace nanogen {
namespace io {

// Opens the file at `path` in read-only mode.
absl::StatusOr<FD> OpenForReading(std::string const& path);

// Duplicates the standard input descriptor so that it can be owned by an `FD`.
absl::StatusOr<FD> DuplicateStdin();

// Reads from `fd` until end of file and returns all the data in a single buffer. Reads interrupted
// by signals are retried.
absl::StatusOr<Buffer> ReadAll(FD const& fd);

}  // namespace io
}  // namespace nanogen

#endif  // __NANOGEN_IO_FILE_H__
