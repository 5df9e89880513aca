#include <cerrno>
#include <cstdio>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/utilities.h"
#include "io/buffer.h"
#include "io/file.h"
#include "options/effective.h"
#include "options/options.h"
#include "options/text.h"

ABSL_FLAG(std::string, input, "",
          "Path of the file containing the serialized options message. The message is read from "
          "standard input if unspecified.");

ABSL_FLAG(bool, effective, false,
          "Print the effective options, i.e. with the defaults applied to the absent fields.");

ABSL_FLAG(nanogen::options::Scope, scope, nanogen::options::Scope::kFile,
          "The kind of element the options are attached to: file, message, or field.");

ABSL_FLAG(bool, reject_unrecognized_enums, false,
          "Fail when an enumeration field has a value that's not declared, rather than falling "
          "back to the field default. Only relevant with --effective.");

namespace {

using ::nanogen::io::Buffer;
using ::nanogen::options::Options;
using ::nanogen::options::Resolve;
using ::nanogen::options::Scope;
using ::nanogen::options::ScopedOptions;
using ::nanogen::options::UnrecognizedEnumPolicy;

absl::StatusOr<Buffer> ReadInput() {
  auto const& path = absl::GetFlag(FLAGS_input);
  if (path.empty()) {
    LOG(INFO) << "reading from standard input";
    DEFINE_CONST_OR_RETURN(fd, nanogen::io::DuplicateStdin());
    return nanogen::io::ReadAll(fd);
  } else {
    LOG(INFO) << "reading " << path;
    DEFINE_CONST_OR_RETURN(fd, nanogen::io::OpenForReading(path));
    return nanogen::io::ReadAll(fd);
  }
}

absl::StatusOr<std::string> Inspect(Options const& options) {
  Scope const scope = absl::GetFlag(FLAGS_scope);
  if (!absl::GetFlag(FLAGS_effective)) {
    return ToText(ScopedOptions{.scope = scope, .options = options});
  }
  auto const policy = absl::GetFlag(FLAGS_reject_unrecognized_enums)
                          ? UnrecognizedEnumPolicy::kReject
                          : UnrecognizedEnumPolicy::kTreatAsAbsent;
  DEFINE_CONST_OR_RETURN(effective, Resolve(options, policy));
  return ToText(scope, effective);
}

absl::Status Run() {
  DEFINE_CONST_OR_RETURN(data, ReadInput());
  LOG(INFO) << "read " << data.size() << " bytes";
  DEFINE_CONST_OR_RETURN(options, Options::Decode(data.span()));
  LOG_IF(INFO, !options.unknown_fields.empty())
      << "retained " << options.unknown_fields.size() << " unknown fields";
  DEFINE_CONST_OR_RETURN(text, Inspect(options));
  if (::fputs(text.c_str(), stdout) < 0) {  // NOLINT
    return absl::ErrnoToStatus(errno, "fputs");
  }
  return absl::OkStatus();
}

}  // namespace

int main(int const argc, char* argv[]) {
  absl::InitializeLog();
  absl::ParseCommandLine(argc, argv);
  auto const status = Run();
  if (!status.ok()) {
    std::string const message{status.message()};
    ::fprintf(stderr, "Error: %s\n", message.c_str());  // NOLINT
    return 1;
  }
  return 0;
}
