#ifndef __NANOGEN_PROTO_WIRE_FORMAT_H__
#define __NANOGEN_PROTO_WIRE_FORMAT_H__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "io/buffer.h"
#include "io/cord.h"
#include "proto/decode_error.h"  // IWYU pragma: export

namespace nanogen {
namespace proto {

struct FieldTag {
  auto tie() const { return std::tie(field_number, wire_type); }

  friend bool operator==(FieldTag const &lhs, FieldTag const &rhs) {
    return lhs.tie() == rhs.tie();
  }

  friend bool operator!=(FieldTag const &lhs, FieldTag const &rhs) {
    return lhs.tie() != rhs.tie();
  }

  friend bool operator<(FieldTag const &lhs, FieldTag const &rhs) { return lhs.tie() < rhs.tie(); }

  uint64_t field_number;
  WireType wire_type;
};

// Reads protobuf wire records from a borrowed byte span. All the values returned as views (strings
// and raw record payloads) point into that span, so they are only valid as long as the underlying
// memory is.
//
// All errors are structural and carry a `DecodeError` payload, see `proto/decode_error.h`.
class Decoder {
 public:
  explicit Decoder(absl::Span<uint8_t const> const data) : data_(data) {}

  ~Decoder() = default;

  Decoder(Decoder const &) = delete;
  Decoder &operator=(Decoder const &) = delete;

  Decoder(Decoder &&) noexcept = default;
  Decoder &operator=(Decoder &&) noexcept = default;

  size_t remaining() const { return data_.size(); }
  bool at_end() const { return data_.empty(); }

  absl::StatusOr<uint64_t> DecodeVarInt();

  // Returns an empty optional when the end of the input has been reached.
  absl::StatusOr<std::optional<FieldTag>> DecodeTag();

  // Decodes a varint and keeps its low 32 bits, as protobuf does for int32 and enum fields.
  absl::StatusOr<int32_t> DecodeInt32();

  // Decodes a varint and keeps its low 32 bits.
  absl::StatusOr<uint32_t> DecodeUInt32();

  // Any non-zero varint is true.
  absl::StatusOr<bool> DecodeBool();

  // Decodes a length-delimited payload without copying it.
  absl::StatusOr<std::string_view> DecodeStringView();

  // Consumes the payload of a record whose tag has just been decoded and returns it verbatim. For
  // length-delimited records the returned span excludes the length prefix. For groups it's the
  // nested records up to, and excluding, the matching end-group tag. For the other wire types it's
  // exactly the bytes that follow the tag.
  //
  // An end-group tag that doesn't close the innermost open group, and the undefined wire types 6
  // and 7, fail with `kUnsupportedWireType`.
  absl::StatusOr<absl::Span<uint8_t const>> DecodeRecordPayload(FieldTag const &tag);

 private:
  static inline size_t constexpr kMaxVarIntLength = 10;

  // Decodes a varint without advancing the `data_` span. The first component of the returned pair
  // is the decoded varint, the second component is the length of the decoded prefix.
  absl::StatusOr<std::pair<uint64_t, size_t>> DecodeVarIntInternal() const;

  absl::StatusOr<absl::Span<uint8_t const>> ConsumePrefix(size_t length);

  // Scans nested records iteratively, so deeply nested groups don't grow the stack.
  absl::StatusOr<absl::Span<uint8_t const>> DecodeGroupPayload(uint64_t field_number);

  absl::Span<uint8_t const> data_;
};

class Encoder {
 public:
  explicit Encoder() = default;
  ~Encoder() = default;

  Encoder(Encoder const &) = delete;
  Encoder &operator=(Encoder const &) = delete;

  Encoder(Encoder &&) noexcept = default;
  Encoder &operator=(Encoder &&) noexcept = default;

  [[nodiscard]] bool empty() const { return cord_.empty(); }
  size_t size() const { return cord_.size(); }

  void EncodeTag(FieldTag const &tag);

  void EncodeVarInt(uint64_t const value) { EncodeIntegerInternal(value); }

  // Negative values are sign-extended to 64 bits, as mandated by the protobuf encoding of int32.
  void EncodeInt32Field(uint64_t number, int32_t value);

  void EncodeUInt32Field(uint64_t number, uint32_t value);
  void EncodeBoolField(uint64_t number, bool value);

  // Enums travel as int32.
  void EncodeEnumField(uint64_t const number, int32_t const value) {
    EncodeInt32Field(number, value);
  }

  void EncodeStringField(uint64_t number, std::string_view value);

  // Emits a record with the given tag and a payload previously returned by
  // `Decoder::DecodeRecordPayload`. The payload is copied byte by byte. Length-delimited records
  // get a freshly encoded length prefix and groups get their end-group tag.
  void EncodeRecord(FieldTag const &tag, absl::Span<uint8_t const> payload);

  nanogen::io::Cord Finish() && { return std::move(cord_); }
  nanogen::io::Buffer Flatten() && { return std::move(cord_).Flatten(); }

 private:
  static inline size_t constexpr kMaxVarIntLength = 10;

  void EncodeIntegerInternal(uint64_t value);
  void EncodeBytes(absl::Span<uint8_t const> bytes);

  nanogen::io::Cord cord_;
};

}  // namespace proto
}  // namespace nanogen

#endif  // __NANOGEN_PROTO_WIRE_FORMAT_H__
