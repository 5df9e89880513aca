#include "common/testing.h"

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "io/fd.h"

namespace {

class FailureSignalHandlerInstaller {
 public:
  explicit FailureSignalHandlerInstaller() {
    absl::InitializeLog();
    absl::InstallFailureSignalHandler(absl::FailureSignalHandlerOptions());
  }
};

FailureSignalHandlerInstaller failure_signal_handler_installer;

char constexpr kTestTmpDirEnvVar[] = "TEST_TMPDIR";
std::string_view constexpr kDefaultTestTmpDir = "/tmp/";

}  // namespace

namespace testing {

std::string GetTestTmpDir() {
  char const* const value = ::getenv(kTestTmpDirEnvVar);
  if (value != nullptr) {
    return std::string(value);
  } else {
    return std::string(kDefaultTestTmpDir);
  }
}

absl::StatusOr<TestTempFile> TestTempFile::Create(std::string_view const base_name) {
  std::string path = MakeTempFileTemplate(base_name);
  nanogen::io::FD fd{::mkstemp(path.data())};
  if (fd.empty()) {
    return absl::ErrnoToStatus(errno, "mkstemp");
  } else {
    return TestTempFile(std::move(path), std::move(fd));
  }
}

TestTempFile::~TestTempFile() {
  if (path_.empty()) {
    return;  // moved from
  }
  fd_.Close();
  if (::unlink(path_.c_str()) < 0) {
    LOG(ERROR) << absl::ErrnoToStatus(errno, "unlink");
  }
}

absl::Status TestTempFile::Write(std::string_view data) {
  while (!data.empty()) {
    ssize_t const result = ::write(*fd_, data.data(), data.size());
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::ErrnoToStatus(errno, "write");
    }
    data.remove_prefix(static_cast<size_t>(result));
  }
  return absl::OkStatus();
}

std::string TestTempFile::MakeTempFileTemplate(std::string_view const base_name) {
  static std::string_view constexpr kSuffix = "_XXXXXX";
  auto const directory = GetTestTmpDir();
  if (absl::EndsWith(directory, "/")) {
    return absl::StrCat(directory, base_name, kSuffix);
  } else {
    return absl::StrCat(directory, "/", base_name, kSuffix);
  }
}

}  // namespace testing
