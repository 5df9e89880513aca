#include "proto/decode_error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "common/utilities.h"

namespace nanogen {
namespace proto {

namespace {

std::string WireTypeField(std::optional<WireType> const wire_type) {
  if (wire_type.has_value()) {
    return absl::StrCat(util::to_underlying(wire_type.value()));
  } else {
    return "";
  }
}

std::optional<WireType> ParseWireTypeField(std::string_view const text) {
  uint32_t value;
  if (text.empty() || !absl::SimpleAtoi(text, &value) || value > 7) {
    return std::nullopt;
  }
  return static_cast<WireType>(value);
}

// The payload is a human-readable "kind;field_number;expected;actual" record so that it shows up
// legibly in `absl::Status::ToString`.
absl::Status MakeError(std::string_view const message, DecodeError const& error) {
  absl::Status status = absl::InvalidArgumentError(message);
  status.SetPayload(kDecodeErrorPayloadUrl,
                    absl::Cord(absl::StrCat(util::to_underlying(error.kind), ";",
                                            error.field_number, ";", WireTypeField(error.expected),
                                            ";", WireTypeField(error.actual))));
  return status;
}

}  // namespace

std::string_view WireTypeName(WireType const wire_type) {
  switch (wire_type) {
    case WireType::kVarInt:
      return "varint";
    case WireType::kInt64:
      return "fixed64";
    case WireType::kLength:
      return "length-delimited";
    case WireType::kDeprecatedStartGroup:
      return "start-group";
    case WireType::kDeprecatedEndGroup:
      return "end-group";
    case WireType::kInt32:
      return "fixed32";
  }
  return "invalid";
}

absl::Status TruncatedInputError() {
  return MakeError("decoding error: reached end of input",
                   DecodeError{.kind = DecodeErrorKind::kTruncatedInput});
}

absl::Status MalformedVarIntError() {
  return MakeError("decoding error: malformed varint",
                   DecodeError{.kind = DecodeErrorKind::kMalformedVarInt});
}

absl::Status WireTypeMismatchError(uint64_t const field_number, WireType const expected,
                                   WireType const actual) {
  return MakeError(absl::StrCat("decoding error: invalid wire type for field ", field_number,
                                ": expected ", WireTypeName(expected), ", got ",
                                WireTypeName(actual)),
                   DecodeError{
                       .kind = DecodeErrorKind::kWireTypeMismatch,
                       .field_number = field_number,
                       .expected = expected,
                       .actual = actual,
                   });
}

absl::Status UnsupportedWireTypeError(uint64_t const field_number, WireType const wire_type) {
  return MakeError(absl::StrCat("decoding error: unsupported wire type ",
                                util::to_underlying(wire_type), " for field ", field_number),
                   DecodeError{
                       .kind = DecodeErrorKind::kUnsupportedWireType,
                       .field_number = field_number,
                       .actual = wire_type,
                   });
}

std::optional<DecodeError> GetDecodeError(absl::Status const& status) {
  auto const maybe_payload = status.GetPayload(kDecodeErrorPayloadUrl);
  if (!maybe_payload.has_value()) {
    return std::nullopt;
  }
  std::vector<std::string> const parts =
      absl::StrSplit(std::string(maybe_payload.value()), ';');
  if (parts.size() != 4) {
    return std::nullopt;
  }
  uint32_t kind;
  if (!absl::SimpleAtoi(parts[0], &kind) ||
      kind < util::to_underlying(DecodeErrorKind::kTruncatedInput) ||
      kind > util::to_underlying(DecodeErrorKind::kUnsupportedWireType)) {
    return std::nullopt;
  }
  DecodeError error{.kind = static_cast<DecodeErrorKind>(kind)};
  if (!absl::SimpleAtoi(parts[1], &error.field_number)) {
    return std::nullopt;
  }
  error.expected = ParseWireTypeField(parts[2]);
  error.actual = ParseWireTypeField(parts[3]);
  return error;
}

}  // namespace proto
}  // namespace nanogen
