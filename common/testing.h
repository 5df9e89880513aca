#ifndef __NANOGEN_COMMON_TESTING_H__
#define __NANOGEN_COMMON_TESTING_H__

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"           // IWYU pragma: export
#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "absl/status/statusor.h"         // IWYU pragma: export
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "io/fd.h"

namespace testing {

// Returns the path of the test temp directory, which is provided in the `TEST_TMPDIR` environment
// variable. Falls back to `/tmp/` if the variable is not set.
std::string GetTestTmpDir();

// Manages a temporary file created with `mkstemp` inside the test temp directory returned by
// `GetTestTmpDir`. Closes and deletes the file automatically upon destruction.
class TestTempFile {
 public:
  static absl::StatusOr<TestTempFile> Create(std::string_view base_name);

  ~TestTempFile();

  TestTempFile(TestTempFile&& other) noexcept
      : path_(std::exchange(other.path_, std::string())), fd_(std::move(other.fd_)) {}

  // The file previously managed by this object is handed over to `other`, which deletes it upon
  // destruction.
  TestTempFile& operator=(TestTempFile&& other) noexcept {
    swap(other);
    return *this;
  }

  void swap(TestTempFile& other) noexcept {
    std::swap(path_, other.path_);
    std::swap(fd_, other.fd_);
  }

  friend void swap(TestTempFile& lhs, TestTempFile& rhs) noexcept { lhs.swap(rhs); }

  std::string_view path() const { return path_; }

  // Writes all of `data` to the file.
  absl::Status Write(std::string_view data);

  // Closes the file and empties the file descriptor. No-op if already closed.
  void Close() { fd_.Close(); }

 private:
  static std::string MakeTempFileTemplate(std::string_view base_name);

  explicit TestTempFile(std::string path, nanogen::io::FD fd)
      : path_(std::move(path)), fd_(std::move(fd)) {}

  TestTempFile(TestTempFile const&) = delete;
  TestTempFile& operator=(TestTempFile const&) = delete;

  std::string path_;
  nanogen::io::FD fd_;
};

}  // namespace testing

// Macros for testing the results of functions that return absl::Status or absl::StatusOr<T> (for
// any type T).
#define EXPECT_OK(expression) EXPECT_THAT((expression), ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT((expression), ::absl_testing::IsOk())

#endif  // __NANOGEN_COMMON_TESTING_H__
