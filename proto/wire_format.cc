#include "proto/wire_format.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "absl/container/inlined_vector.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "io/buffer.h"
#include "proto/decode_error.h"

namespace nanogen {
namespace proto {

absl::StatusOr<uint64_t> Decoder::DecodeVarInt() {
  DEFINE_CONST_OR_RETURN(result, DecodeVarIntInternal());
  auto const [value, length] = result;
  data_.remove_prefix(length);
  return value;
}

absl::StatusOr<std::optional<FieldTag>> Decoder::DecodeTag() {
  if (data_.empty()) {
    return std::optional<FieldTag>();
  }
  DEFINE_CONST_OR_RETURN(tag, DecodeVarInt());
  return std::make_optional(FieldTag{
      .field_number = tag >> 3,
      .wire_type = static_cast<WireType>(tag & 7),
  });
}

absl::StatusOr<int32_t> Decoder::DecodeInt32() {
  DEFINE_CONST_OR_RETURN(value, DecodeVarInt());
  return static_cast<int32_t>(static_cast<uint32_t>(value));
}

absl::StatusOr<uint32_t> Decoder::DecodeUInt32() {
  DEFINE_CONST_OR_RETURN(value, DecodeVarInt());
  return static_cast<uint32_t>(value);
}

absl::StatusOr<bool> Decoder::DecodeBool() {
  DEFINE_CONST_OR_RETURN(value, DecodeVarInt());
  return value != 0;
}

absl::StatusOr<std::string_view> Decoder::DecodeStringView() {
  DEFINE_CONST_OR_RETURN(length, DecodeVarInt());
  DEFINE_CONST_OR_RETURN(bytes, ConsumePrefix(length));
  return std::string_view(reinterpret_cast<char const *>(bytes.data()), bytes.size());
}

absl::StatusOr<absl::Span<uint8_t const>> Decoder::DecodeRecordPayload(FieldTag const &tag) {
  switch (tag.wire_type) {
    case WireType::kVarInt: {
      DEFINE_CONST_OR_RETURN(result, DecodeVarIntInternal());
      return ConsumePrefix(result.second);
    }
    case WireType::kInt64:
      return ConsumePrefix(8);
    case WireType::kLength: {
      DEFINE_CONST_OR_RETURN(length, DecodeVarInt());
      return ConsumePrefix(length);
    }
    case WireType::kInt32:
      return ConsumePrefix(4);
    case WireType::kDeprecatedStartGroup:
      return DecodeGroupPayload(tag.field_number);
    default:
      return UnsupportedWireTypeError(tag.field_number, tag.wire_type);
  }
}

absl::StatusOr<absl::Span<uint8_t const>> Decoder::DecodeGroupPayload(
    uint64_t const field_number) {
  auto const start = data_;
  absl::InlinedVector<uint64_t, 4> open_groups{field_number};
  while (true) {
    size_t const offset = start.size() - data_.size();
    DEFINE_CONST_OR_RETURN(maybe_tag, DecodeTag());
    if (!maybe_tag.has_value()) {
      return TruncatedInputError();
    }
    auto const &tag = maybe_tag.value();
    switch (tag.wire_type) {
      case WireType::kDeprecatedStartGroup:
        open_groups.push_back(tag.field_number);
        break;
      case WireType::kDeprecatedEndGroup:
        if (tag.field_number != open_groups.back()) {
          return UnsupportedWireTypeError(tag.field_number, tag.wire_type);
        }
        open_groups.pop_back();
        if (open_groups.empty()) {
          return start.subspan(0, offset);
        }
        break;
      default:
        RETURN_IF_ERROR(DecodeRecordPayload(tag));
        break;
    }
  }
}

absl::StatusOr<std::pair<uint64_t, size_t>> Decoder::DecodeVarIntInternal() const {
  uint64_t value = 0;
  for (size_t i = 0; i < kMaxVarIntLength; ++i) {
    if (i >= data_.size()) {
      return TruncatedInputError();
    }
    uint8_t const byte = data_[i];
    // The 10th byte only has room for the 64th bit.
    if (i == kMaxVarIntLength - 1 && (byte & 0x7F) > 1) {
      return MalformedVarIntError();
    }
    value |= (uint64_t{byte} & 0x7FULL) << (7 * i);
    if ((byte & 0x80) == 0) {
      return std::make_pair(value, i + 1);
    }
  }
  return MalformedVarIntError();
}

absl::StatusOr<absl::Span<uint8_t const>> Decoder::ConsumePrefix(size_t const length) {
  if (data_.size() < length) {
    return TruncatedInputError();
  }
  auto const prefix = data_.subspan(0, length);
  data_.remove_prefix(length);
  return prefix;
}

void Encoder::EncodeTag(FieldTag const &tag) {
  EncodeIntegerInternal((tag.field_number << 3) | util::to_underlying(tag.wire_type));
}

void Encoder::EncodeInt32Field(uint64_t const number, int32_t const value) {
  EncodeTag(FieldTag{.field_number = number, .wire_type = WireType::kVarInt});
  EncodeIntegerInternal(static_cast<uint64_t>(static_cast<int64_t>(value)));
}

void Encoder::EncodeUInt32Field(uint64_t const number, uint32_t const value) {
  EncodeTag(FieldTag{.field_number = number, .wire_type = WireType::kVarInt});
  EncodeIntegerInternal(value);
}

void Encoder::EncodeBoolField(uint64_t const number, bool const value) {
  EncodeTag(FieldTag{.field_number = number, .wire_type = WireType::kVarInt});
  EncodeIntegerInternal(value ? 1 : 0);
}

void Encoder::EncodeStringField(uint64_t const number, std::string_view const value) {
  EncodeTag(FieldTag{.field_number = number, .wire_type = WireType::kLength});
  EncodeIntegerInternal(value.size());
  EncodeBytes(
      absl::Span<uint8_t const>(reinterpret_cast<uint8_t const *>(value.data()), value.size()));
}

void Encoder::EncodeRecord(FieldTag const &tag, absl::Span<uint8_t const> const payload) {
  EncodeTag(tag);
  if (tag.wire_type == WireType::kLength) {
    EncodeIntegerInternal(payload.size());
  }
  EncodeBytes(payload);
  if (tag.wire_type == WireType::kDeprecatedStartGroup) {
    EncodeTag({.field_number = tag.field_number, .wire_type = WireType::kDeprecatedEndGroup});
  }
}

void Encoder::EncodeIntegerInternal(uint64_t bits) {
  nanogen::io::Buffer buffer{kMaxVarIntLength};
  while (bits > 0x7F) {
    buffer.Append<uint8_t>(0x80 | static_cast<uint8_t>(bits & 0x7F));
    bits >>= 7;
  }
  buffer.Append<uint8_t>(bits & 0x7F);
  cord_.Append(std::move(buffer));
}

void Encoder::EncodeBytes(absl::Span<uint8_t const> const bytes) {
  cord_.Append(nanogen::io::Buffer(bytes));
}

}  // namespace proto
}  // namespace nanogen
