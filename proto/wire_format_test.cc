#include "proto/wire_format.h"

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/types/span.h"
#include "common/testing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "io/buffer.h"
#include "io/buffer_testing.h"
#include "proto/decode_error.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::nanogen::proto::DecodeError;
using ::nanogen::proto::DecodeErrorKind;
using ::nanogen::proto::Decoder;
using ::nanogen::proto::Encoder;
using ::nanogen::proto::FieldTag;
using ::nanogen::proto::GetDecodeError;
using ::nanogen::proto::WireType;
using ::nanogen::testing::io::BufferAsBytes;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Optional;

std::optional<DecodeErrorKind> GetErrorKind(absl::Status const& status) {
  auto const error = GetDecodeError(status);
  if (error.has_value()) {
    return error->kind;
  } else {
    return std::nullopt;
  }
}

TEST(DecoderTest, InitialState) {
  std::vector<uint8_t> const data{0x82, 0x24, 0x83, 0x92, 0x01};
  Decoder decoder{data};
  EXPECT_FALSE(decoder.at_end());
  EXPECT_EQ(decoder.remaining(), 5);
}

TEST(DecoderTest, DecodeSome) {
  std::vector<uint8_t> const data{0x82, 0x24, 0x83, 0x92, 0x01};
  Decoder decoder{data};
  ASSERT_THAT(decoder.DecodeVarInt(), IsOkAndHolds(4610));
  EXPECT_FALSE(decoder.at_end());
  EXPECT_EQ(decoder.remaining(), 3);
}

TEST(DecoderTest, DecodeAll) {
  std::vector<uint8_t> const data{0x82, 0x24, 0x83, 0x92, 0x01};
  Decoder decoder{data};
  ASSERT_THAT(decoder.DecodeVarInt(), IsOkAndHolds(4610));
  ASSERT_THAT(decoder.DecodeVarInt(), IsOkAndHolds(18691));
  EXPECT_TRUE(decoder.at_end());
  EXPECT_EQ(decoder.remaining(), 0);
}

TEST(DecoderTest, DecodeSingleByteTag) {
  EXPECT_THAT(Decoder{{0x10}}.DecodeTag(),
              IsOkAndHolds(FieldTag{.field_number = 2, .wire_type = WireType::kVarInt}));
  EXPECT_THAT(Decoder{{0x12}}.DecodeTag(),
              IsOkAndHolds(FieldTag{.field_number = 2, .wire_type = WireType::kLength}));
  EXPECT_THAT(Decoder{{0x19}}.DecodeTag(),
              IsOkAndHolds(FieldTag{.field_number = 3, .wire_type = WireType::kInt64}));
  EXPECT_THAT(Decoder{{0x1D}}.DecodeTag(),
              IsOkAndHolds(FieldTag{.field_number = 3, .wire_type = WireType::kInt32}));
}

TEST(DecoderTest, DecodeTwoByteTag) {
  EXPECT_THAT((Decoder{{0x80, 0x7D}}.DecodeTag()),
              IsOkAndHolds(FieldTag{.field_number = 2000, .wire_type = WireType::kVarInt}));
  EXPECT_THAT((Decoder{{0x8D, 0x7D}}.DecodeTag()),
              IsOkAndHolds(FieldTag{.field_number = 2001, .wire_type = WireType::kInt32}));
}

TEST(DecoderTest, DecodeTagAtEnd) {
  std::vector<uint8_t> const data;
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeTag(), IsOkAndHolds(std::nullopt));
}

TEST(DecoderTest, DecodeSingleByteInteger) {
  std::vector<uint8_t> const data{0x42};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeVarInt(), IsOkAndHolds(66));
}

TEST(DecoderTest, EmptyInteger) {
  std::vector<uint8_t> const data;
  Decoder decoder{data};
  auto const status = decoder.DecodeVarInt().status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kTruncatedInput));
}

TEST(DecoderTest, UnterminatedInteger) {
  std::vector<uint8_t> const data{0x82, 0x83};
  Decoder decoder{data};
  auto const status = decoder.DecodeVarInt().status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kTruncatedInput));
}

TEST(DecoderTest, DecodeMaxInteger) {
  std::vector<uint8_t> const data{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeVarInt(), IsOkAndHolds(0xFFFFFFFFFFFFFFFFULL));
  EXPECT_TRUE(decoder.at_end());
}

TEST(DecoderTest, IntegerOverflow) {
  std::vector<uint8_t> const data{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x02};
  Decoder decoder{data};
  auto const status = decoder.DecodeVarInt().status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kMalformedVarInt));
}

TEST(DecoderTest, OverlongInteger) {
  std::vector<uint8_t> const data{0x80, 0x80, 0x80, 0x80, 0x80, 0x80,
                                  0x80, 0x80, 0x80, 0x80, 0x00};
  Decoder decoder{data};
  auto const status = decoder.DecodeVarInt().status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kMalformedVarInt));
}

TEST(DecoderTest, DecodeInt32) {
  EXPECT_THAT((Decoder{{0x2A}}.DecodeInt32()), IsOkAndHolds(42));
  EXPECT_THAT((Decoder{{0xFF, 0xFF, 0xFF, 0xFF, 0x07}}.DecodeInt32()), IsOkAndHolds(2147483647));
}

TEST(DecoderTest, DecodeNegativeInt32) {
  EXPECT_THAT(
      (Decoder{{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01}}.DecodeInt32()),
      IsOkAndHolds(-1));
  EXPECT_THAT((Decoder{{0xFF, 0xFF, 0xFF, 0xFF, 0x0F}}.DecodeInt32()), IsOkAndHolds(-1));
}

TEST(DecoderTest, Int32KeepsLowBits) {
  // 2^32 + 5
  EXPECT_THAT((Decoder{{0x85, 0x80, 0x80, 0x80, 0x10}}.DecodeInt32()), IsOkAndHolds(5));
}

TEST(DecoderTest, DecodeUInt32) {
  EXPECT_THAT((Decoder{{0xFF, 0xFF, 0xFF, 0xFF, 0x0F}}.DecodeUInt32()),
              IsOkAndHolds(0xFFFFFFFFU));
  EXPECT_THAT((Decoder{{0x81, 0x80, 0x80, 0x80, 0x10}}.DecodeUInt32()), IsOkAndHolds(1));
}

TEST(DecoderTest, DecodeBool) {
  EXPECT_THAT(Decoder{{0x00}}.DecodeBool(), IsOkAndHolds(false));
  EXPECT_THAT(Decoder{{0x01}}.DecodeBool(), IsOkAndHolds(true));
  EXPECT_THAT(Decoder{{0x02}}.DecodeBool(), IsOkAndHolds(true));
  EXPECT_THAT((Decoder{{0x80, 0x01}}.DecodeBool()), IsOkAndHolds(true));
}

TEST(DecoderTest, DecodeStringView) {
  std::vector<uint8_t> const data{0x05, 'l', 'o', 'r', 'e', 'm', 0x08};
  Decoder decoder{data};
  auto const status_or_value = decoder.DecodeStringView();
  ASSERT_OK(status_or_value);
  EXPECT_EQ(status_or_value.value(), "lorem");
  EXPECT_EQ(static_cast<void const*>(status_or_value.value().data()),
            static_cast<void const*>(data.data() + 1));
  EXPECT_EQ(decoder.remaining(), 1);
}

TEST(DecoderTest, DecodeEmptyStringView) {
  EXPECT_THAT(Decoder{{0x00}}.DecodeStringView(), IsOkAndHolds(""));
}

TEST(DecoderTest, TruncatedString) {
  std::vector<uint8_t> const data{0x05, 'l', 'o', 'r'};
  Decoder decoder{data};
  auto const status = decoder.DecodeStringView().status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kTruncatedInput));
}

TEST(DecoderTest, VarIntRecordPayload) {
  std::vector<uint8_t> const data{0xAC, 0x02, 0x01};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kVarInt}),
              IsOkAndHolds(ElementsAre(0xAC, 0x02)));
  EXPECT_EQ(decoder.remaining(), 1);
}

TEST(DecoderTest, Fixed64RecordPayload) {
  std::vector<uint8_t> const data{1, 2, 3, 4, 5, 6, 7, 8, 9};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kInt64}),
              IsOkAndHolds(ElementsAre(1, 2, 3, 4, 5, 6, 7, 8)));
  EXPECT_EQ(decoder.remaining(), 1);
}

TEST(DecoderTest, Fixed32RecordPayload) {
  std::vector<uint8_t> const data{1, 2, 3, 4};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kInt32}),
              IsOkAndHolds(ElementsAre(1, 2, 3, 4)));
  EXPECT_TRUE(decoder.at_end());
}

TEST(DecoderTest, TruncatedFixed32RecordPayload) {
  std::vector<uint8_t> const data{1, 2, 3};
  Decoder decoder{data};
  auto const status =
      decoder.DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kInt32}).status();
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kTruncatedInput));
}

TEST(DecoderTest, LengthDelimitedRecordPayload) {
  std::vector<uint8_t> const data{0x03, 'a', 'b', 'c'};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kLength}),
              IsOkAndHolds(ElementsAre('a', 'b', 'c')));
  EXPECT_TRUE(decoder.at_end());
}

TEST(DecoderTest, GroupRecordPayload) {
  std::vector<uint8_t> const data{0x08, 0x01, 0x0C, 0x01};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload(
                  {.field_number = 1, .wire_type = WireType::kDeprecatedStartGroup}),
              IsOkAndHolds(ElementsAre(0x08, 0x01)));
  EXPECT_EQ(decoder.remaining(), 1);
}

TEST(DecoderTest, EmptyGroupRecordPayload) {
  std::vector<uint8_t> const data{0xA4, 0x06};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload(
                  {.field_number = 100, .wire_type = WireType::kDeprecatedStartGroup}),
              IsOkAndHolds(IsEmpty()));
  EXPECT_TRUE(decoder.at_end());
}

TEST(DecoderTest, NestedGroupRecordPayload) {
  std::vector<uint8_t> const data{0x08, 0x01, 0x13, 0x18, 0x05, 0x14, 0xA4, 0x06};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload(
                  {.field_number = 100, .wire_type = WireType::kDeprecatedStartGroup}),
              IsOkAndHolds(ElementsAre(0x08, 0x01, 0x13, 0x18, 0x05, 0x14)));
  EXPECT_TRUE(decoder.at_end());
}

TEST(DecoderTest, NestedGroupWithSameFieldNumber) {
  std::vector<uint8_t> const data{0xA3, 0x06, 0xA4, 0x06, 0xA4, 0x06};
  Decoder decoder{data};
  EXPECT_THAT(decoder.DecodeRecordPayload(
                  {.field_number = 100, .wire_type = WireType::kDeprecatedStartGroup}),
              IsOkAndHolds(ElementsAre(0xA3, 0x06, 0xA4, 0x06)));
  EXPECT_TRUE(decoder.at_end());
}

TEST(DecoderTest, UnterminatedGroupRecordPayload) {
  std::vector<uint8_t> const data{0x08, 0x01};
  Decoder decoder{data};
  auto const status =
      decoder
          .DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kDeprecatedStartGroup})
          .status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kTruncatedInput));
}

TEST(DecoderTest, TruncatedRecordInsideGroup) {
  std::vector<uint8_t> const data{0x12, 0x05, 'a'};
  Decoder decoder{data};
  auto const status =
      decoder
          .DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kDeprecatedStartGroup})
          .status();
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kTruncatedInput));
}

TEST(DecoderTest, MismatchedEndGroup) {
  std::vector<uint8_t> const data{0x08, 0x01, 0xAC, 0x06};
  Decoder decoder{data};
  auto const status =
      decoder
          .DecodeRecordPayload({.field_number = 100, .wire_type = WireType::kDeprecatedStartGroup})
          .status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(GetDecodeError(status),
              Optional(DecodeError{.kind = DecodeErrorKind::kUnsupportedWireType,
                                   .field_number = 101,
                                   .actual = WireType::kDeprecatedEndGroup}));
}

TEST(DecoderTest, StrayEndGroupRecordPayload) {
  std::vector<uint8_t> const data{0x00};
  Decoder decoder{data};
  auto const status =
      decoder.DecodeRecordPayload({.field_number = 3, .wire_type = WireType::kDeprecatedEndGroup})
          .status();
  EXPECT_THAT(GetDecodeError(status),
              Optional(DecodeError{.kind = DecodeErrorKind::kUnsupportedWireType,
                                   .field_number = 3,
                                   .actual = WireType::kDeprecatedEndGroup}));
}

TEST(DecoderTest, UndefinedWireTypeInsideGroup) {
  std::vector<uint8_t> const data{0x0E, 0x00, 0x0C};
  Decoder decoder{data};
  auto const status =
      decoder
          .DecodeRecordPayload({.field_number = 1, .wire_type = WireType::kDeprecatedStartGroup})
          .status();
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kUnsupportedWireType));
}

TEST(DecoderTest, UndefinedWireTypeRecordPayload) {
  std::vector<uint8_t> const data{0x00};
  Decoder decoder{data};
  auto const status =
      decoder.DecodeRecordPayload({.field_number = 5, .wire_type = static_cast<WireType>(7)})
          .status();
  EXPECT_THAT(GetErrorKind(status), Optional(DecodeErrorKind::kUnsupportedWireType));
}

TEST(EncoderTest, Empty) {
  Encoder encoder;
  EXPECT_TRUE(encoder.empty());
  EXPECT_EQ(encoder.size(), 0);
  EXPECT_THAT(std::move(encoder).Flatten(), BufferAsBytes(IsEmpty()));
}

TEST(EncoderTest, EncodeTag) {
  Encoder encoder;
  encoder.EncodeTag({.field_number = 2, .wire_type = WireType::kLength});
  encoder.EncodeTag({.field_number = 2001, .wire_type = WireType::kInt32});
  EXPECT_THAT(std::move(encoder).Flatten(), BufferAsBytes(ElementsAre(0x12, 0x8D, 0x7D)));
}

TEST(EncoderTest, EncodeVarInt) {
  Encoder encoder;
  encoder.EncodeVarInt(0);
  encoder.EncodeVarInt(4610);
  encoder.EncodeVarInt(18691);
  EXPECT_EQ(encoder.size(), 6);
  EXPECT_THAT(std::move(encoder).Flatten(),
              BufferAsBytes(ElementsAre(0x00, 0x82, 0x24, 0x83, 0x92, 0x01)));
}

TEST(EncoderTest, EncodeMaxVarInt) {
  Encoder encoder;
  encoder.EncodeVarInt(0xFFFFFFFFFFFFFFFFULL);
  EXPECT_THAT(
      std::move(encoder).Flatten(),
      BufferAsBytes(ElementsAre(0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01)));
}

TEST(EncoderTest, EncodeInt32Field) {
  Encoder encoder;
  encoder.EncodeInt32Field(1, 64);
  EXPECT_THAT(std::move(encoder).Flatten(), BufferAsBytes(ElementsAre(0x08, 0x40)));
}

TEST(EncoderTest, EncodeNegativeInt32Field) {
  Encoder encoder;
  encoder.EncodeInt32Field(1, -1);
  EXPECT_THAT(std::move(encoder).Flatten(),
              BufferAsBytes(
                  ElementsAre(0x08, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01)));
}

TEST(EncoderTest, EncodeUInt32Field) {
  Encoder encoder;
  encoder.EncodeUInt32Field(9, 0xFFFFFFFFU);
  EXPECT_THAT(std::move(encoder).Flatten(),
              BufferAsBytes(ElementsAre(0x48, 0xFF, 0xFF, 0xFF, 0xFF, 0x0F)));
}

TEST(EncoderTest, EncodeBoolField) {
  Encoder encoder;
  encoder.EncodeBoolField(4, false);
  encoder.EncodeBoolField(4, true);
  EXPECT_THAT(std::move(encoder).Flatten(), BufferAsBytes(ElementsAre(0x20, 0x00, 0x20, 0x01)));
}

TEST(EncoderTest, EncodeEnumField) {
  Encoder encoder;
  encoder.EncodeEnumField(3, 4);
  EXPECT_THAT(std::move(encoder).Flatten(), BufferAsBytes(ElementsAre(0x18, 0x04)));
}

TEST(EncoderTest, EncodeStringField) {
  Encoder encoder;
  encoder.EncodeStringField(24, "a.h");
  encoder.EncodeStringField(24, "");
  EXPECT_THAT(std::move(encoder).Flatten(),
              BufferAsBytes(ElementsAre(0xC2, 0x01, 0x03, 'a', '.', 'h', 0xC2, 0x01, 0x00)));
}

TEST(EncoderTest, EncodeRecords) {
  uint8_t const varint[] = {0xAC, 0x02};
  uint8_t const fixed32[] = {1, 2, 3, 4};
  uint8_t const content[] = {'x', 'y'};
  Encoder encoder;
  encoder.EncodeRecord({.field_number = 100, .wire_type = WireType::kVarInt}, varint);
  encoder.EncodeRecord({.field_number = 1, .wire_type = WireType::kInt32}, fixed32);
  encoder.EncodeRecord({.field_number = 2, .wire_type = WireType::kLength}, content);
  EXPECT_THAT(std::move(encoder).Flatten(),
              BufferAsBytes(ElementsAre(0xA0, 0x06, 0xAC, 0x02, 0x0D, 1, 2, 3, 4, 0x12, 0x02, 'x',
                                        'y')));
}

TEST(EncoderTest, EncodeGroupRecord) {
  uint8_t const group[] = {0x08, 0x01};
  Encoder encoder;
  encoder.EncodeRecord({.field_number = 100, .wire_type = WireType::kDeprecatedStartGroup}, group);
  encoder.EncodeRecord({.field_number = 1, .wire_type = WireType::kDeprecatedStartGroup}, {});
  EXPECT_THAT(std::move(encoder).Flatten(),
              BufferAsBytes(ElementsAre(0xA3, 0x06, 0x08, 0x01, 0xA4, 0x06, 0x0B, 0x0C)));
}

TEST(EncoderTest, Finish) {
  Encoder encoder;
  encoder.EncodeBoolField(4, true);
  auto cord = std::move(encoder).Finish();
  EXPECT_EQ(cord.size(), 2);
  EXPECT_THAT(std::move(cord).Flatten(), BufferAsBytes(ElementsAre(0x20, 0x01)));
}

}  // namespace
