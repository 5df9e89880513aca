#ifndef __NANOGEN_PROTO_DECODE_ERROR_H__
#define __NANOGEN_PROTO_DECODE_ERROR_H__

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

#include "absl/status/status.h"

namespace nanogen {
namespace proto {

enum class WireType : uint8_t {
  kVarInt = 0,
  kInt64 = 1,
  kLength = 2,
  kDeprecatedStartGroup = 3,
  kDeprecatedEndGroup = 4,
  kInt32 = 5,
};

std::string_view WireTypeName(WireType wire_type);

// Structural decoding failures. All of them abort the current decode call.
enum class DecodeErrorKind : uint8_t {
  // A length-delimited record or a varint extends past the end of the buffer.
  kTruncatedInput = 1,

  // A varint has no terminating byte within 10 bytes, or doesn't fit in 64 bits.
  kMalformedVarInt = 2,

  // A known field appears with a wire type that's incompatible with its declared kind.
  kWireTypeMismatch = 3,

  // A record uses one of the undefined wire types 6 and 7, or an end-group tag doesn't close the
  // innermost open group.
  kUnsupportedWireType = 4,
};

// Details of a decoding failure, attached to the returned `absl::Status` as a payload. Retrieve it
// with `GetDecodeError`.
struct DecodeError {
  auto tie() const { return std::tie(kind, field_number, expected, actual); }

  friend bool operator==(DecodeError const &lhs, DecodeError const &rhs) {
    return lhs.tie() == rhs.tie();
  }

  friend bool operator!=(DecodeError const &lhs, DecodeError const &rhs) {
    return lhs.tie() != rhs.tie();
  }

  DecodeErrorKind kind;

  // Only set for `kWireTypeMismatch` and `kUnsupportedWireType`.
  uint64_t field_number = 0;

  // Only set for `kWireTypeMismatch`.
  std::optional<WireType> expected;

  // Set for `kWireTypeMismatch` and `kUnsupportedWireType`.
  std::optional<WireType> actual;
};

inline std::string_view constexpr kDecodeErrorPayloadUrl = "nanogen.proto.DecodeError";

absl::Status TruncatedInputError();
absl::Status MalformedVarIntError();
absl::Status WireTypeMismatchError(uint64_t field_number, WireType expected, WireType actual);
absl::Status UnsupportedWireTypeError(uint64_t field_number, WireType wire_type);

// Extracts the `DecodeError` payload from `status`. Returns an empty optional if `status` is OK or
// wasn't generated by the decoder.
std::optional<DecodeError> GetDecodeError(absl::Status const &status);

}  // namespace proto
}  // namespace nanogen

#endif  // __NANOGEN_PROTO_DECODE_ERROR_H__
