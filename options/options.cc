#include "options/options.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "io/cord.h"
#include "options/enums.h"
#include "options/field_table.h"
#include "proto/wire_format.h"

namespace nanogen {
namespace options {

namespace {

using ::nanogen::proto::Decoder;
using ::nanogen::proto::Encoder;
using ::nanogen::proto::FieldTag;

// Largest field number whose shifted tag still fits in 64 bits.
uint64_t constexpr kMaxFieldNumber = (uint64_t{1} << 61) - 1;

absl::Status DecodeValue(Decoder* const decoder, std::optional<int32_t>* const field) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeInt32());
  *field = value;
  return absl::OkStatus();
}

absl::Status DecodeValue(Decoder* const decoder, std::optional<uint32_t>* const field) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeUInt32());
  *field = value;
  return absl::OkStatus();
}

absl::Status DecodeValue(Decoder* const decoder, std::optional<bool>* const field) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeBool());
  *field = value;
  return absl::OkStatus();
}

absl::Status DecodeValue(Decoder* const decoder, std::optional<std::string_view>* const field) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeStringView());
  *field = value;
  return absl::OkStatus();
}

// Undeclared discriminants are kept as they are.
template <typename Enum>
absl::Status DecodeValue(Decoder* const decoder, std::optional<EnumValue<Enum>>* const field) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeInt32());
  *field = EnumValue<Enum>::FromRaw(value);
  return absl::OkStatus();
}

absl::Status DecodeValue(Decoder* const decoder, std::vector<std::string_view>* const field) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeStringView());
  field->emplace_back(value);
  return absl::OkStatus();
}

// Decodes the value of a known field whose tag has already been consumed and validated.
absl::Status DecodeKnownField(Decoder* const decoder, uint32_t const number,
                              Options* const options) {
  switch (number) {
    case kMaxSizeField:
      return DecodeValue(decoder, &options->max_size);
    case kMaxCountField:
      return DecodeValue(decoder, &options->max_count);
    case kTypeField:
      return DecodeValue(decoder, &options->type);
    case kLongNamesField:
      return DecodeValue(decoder, &options->long_names);
    case kPackedStructField:
      return DecodeValue(decoder, &options->packed_struct);
    case kSkipMessageField:
      return DecodeValue(decoder, &options->skip_message);
    case kIntSizeField:
      return DecodeValue(decoder, &options->int_size);
    case kNoUnionsField:
      return DecodeValue(decoder, &options->no_unions);
    case kMsgIdField:
      return DecodeValue(decoder, &options->msgid);
    case kPackedEnumField:
      return DecodeValue(decoder, &options->packed_enum);
    case kAnonymousOneofField:
      return DecodeValue(decoder, &options->anonymous_oneof);
    case kProto3Field:
      return DecodeValue(decoder, &options->proto3);
    case kEnumToStringField:
      return DecodeValue(decoder, &options->enum_to_string);
    case kMaxLengthField:
      return DecodeValue(decoder, &options->max_length);
    case kFixedLengthField:
      return DecodeValue(decoder, &options->fixed_length);
    case kFixedCountField:
      return DecodeValue(decoder, &options->fixed_count);
    case kMangleNamesField:
      return DecodeValue(decoder, &options->mangle_names);
    case kCallbackDatatypeField:
      return DecodeValue(decoder, &options->callback_datatype);
    case kCallbackFunctionField:
      return DecodeValue(decoder, &options->callback_function);
    case kDescriptorSizeField:
      return DecodeValue(decoder, &options->descriptorsize);
    case kProto3SingularMsgsField:
      return DecodeValue(decoder, &options->proto3_singular_msgs);
    case kSubmsgCallbackField:
      return DecodeValue(decoder, &options->submsg_callback);
    case kDefaultHasField:
      return DecodeValue(decoder, &options->default_has);
    case kIncludeField:
      return DecodeValue(decoder, &options->include);
    case kPackageField:
      return DecodeValue(decoder, &options->package);
    case kExcludeField:
      return DecodeValue(decoder, &options->exclude);
    case kTypeOverrideField:
      return DecodeValue(decoder, &options->type_override);
    case kSortByTagField:
      return DecodeValue(decoder, &options->sort_by_tag);
    case kFallbackTypeField:
      return DecodeValue(decoder, &options->fallback_type);
    default:
      return absl::InternalError(absl::StrCat("no decoder for field number ", number));
  }
}

void EncodeValue(Encoder* const encoder, uint32_t const number,
                 std::optional<int32_t> const& field) {
  if (field.has_value()) {
    encoder->EncodeInt32Field(number, *field);
  }
}

void EncodeValue(Encoder* const encoder, uint32_t const number,
                 std::optional<uint32_t> const& field) {
  if (field.has_value()) {
    encoder->EncodeUInt32Field(number, *field);
  }
}

void EncodeValue(Encoder* const encoder, uint32_t const number, std::optional<bool> const& field) {
  if (field.has_value()) {
    encoder->EncodeBoolField(number, *field);
  }
}

void EncodeValue(Encoder* const encoder, uint32_t const number,
                 std::optional<std::string_view> const& field) {
  if (field.has_value()) {
    encoder->EncodeStringField(number, *field);
  }
}

template <typename Enum>
void EncodeValue(Encoder* const encoder, uint32_t const number,
                 std::optional<EnumValue<Enum>> const& field) {
  if (field.has_value()) {
    encoder->EncodeEnumField(number, field->raw());
  }
}

void EncodeValue(Encoder* const encoder, uint32_t const number,
                 std::vector<std::string_view> const& field) {
  for (auto const value : field) {
    encoder->EncodeStringField(number, value);
  }
}

}  // namespace

absl::Status CheckUnknownField(UnknownField const& field) {
  if (FindField(field.number) != nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("field number ", field.number, " belongs to a known field"));
  }
  if (field.number > kMaxFieldNumber) {
    return absl::InvalidArgumentError(
        absl::StrCat("field number ", field.number, " doesn't fit in a tag"));
  }
  FieldTag const tag{.field_number = field.number, .wire_type = field.wire_type};
  Encoder encoder;
  encoder.EncodeRecord(tag, field.payload);
  auto const buffer = std::move(encoder).Flatten();
  Decoder decoder{buffer.span()};
  auto const status_or_payload = [&]() -> absl::StatusOr<absl::Span<uint8_t const>> {
    DEFINE_CONST_OR_RETURN(decoded_tag, decoder.DecodeTag());
    return decoder.DecodeRecordPayload(decoded_tag.value());
  }();
  if (!status_or_payload.ok()) {
    return absl::InvalidArgumentError(absl::StrCat("malformed payload for unknown field ",
                                                   field.number, ": ",
                                                   status_or_payload.status().message()));
  }
  auto const& payload = status_or_payload.value();
  if (!decoder.at_end() || !std::equal(payload.begin(), payload.end(), field.payload.begin(),
                                       field.payload.end())) {
    return absl::InvalidArgumentError(
        absl::StrCat("malformed payload for unknown field ", field.number));
  }
  return absl::OkStatus();
}

absl::StatusOr<Options> Options::Decode(absl::Span<uint8_t const> const data) {
  Options options;
  Decoder decoder{data};
  while (true) {
    DEFINE_CONST_OR_RETURN(maybe_tag, decoder.DecodeTag());
    if (!maybe_tag.has_value()) {
      break;
    }
    auto const& tag = maybe_tag.value();
    auto const* const field = FindField(tag.field_number);
    if (field == nullptr) {
      DEFINE_CONST_OR_RETURN(payload, decoder.DecodeRecordPayload(tag));
      options.unknown_fields.push_back(UnknownField{
          .number = tag.field_number,
          .wire_type = tag.wire_type,
          .payload = payload,
      });
      continue;
    }
    auto const expected = ExpectedWireType(field->kind);
    if (tag.wire_type != expected) {
      return proto::WireTypeMismatchError(tag.field_number, expected, tag.wire_type);
    }
    RETURN_IF_ERROR(DecodeKnownField(&decoder, field->number, &options));
  }
  return options;
}

nanogen::io::Cord Options::Encode(Options const& options) {
  Encoder encoder;
  EncodeValue(&encoder, kMaxSizeField, options.max_size);
  EncodeValue(&encoder, kMaxCountField, options.max_count);
  EncodeValue(&encoder, kTypeField, options.type);
  EncodeValue(&encoder, kLongNamesField, options.long_names);
  EncodeValue(&encoder, kPackedStructField, options.packed_struct);
  EncodeValue(&encoder, kSkipMessageField, options.skip_message);
  EncodeValue(&encoder, kIntSizeField, options.int_size);
  EncodeValue(&encoder, kNoUnionsField, options.no_unions);
  EncodeValue(&encoder, kMsgIdField, options.msgid);
  EncodeValue(&encoder, kPackedEnumField, options.packed_enum);
  EncodeValue(&encoder, kAnonymousOneofField, options.anonymous_oneof);
  EncodeValue(&encoder, kProto3Field, options.proto3);
  EncodeValue(&encoder, kEnumToStringField, options.enum_to_string);
  EncodeValue(&encoder, kMaxLengthField, options.max_length);
  EncodeValue(&encoder, kFixedLengthField, options.fixed_length);
  EncodeValue(&encoder, kFixedCountField, options.fixed_count);
  EncodeValue(&encoder, kMangleNamesField, options.mangle_names);
  EncodeValue(&encoder, kCallbackDatatypeField, options.callback_datatype);
  EncodeValue(&encoder, kCallbackFunctionField, options.callback_function);
  EncodeValue(&encoder, kDescriptorSizeField, options.descriptorsize);
  EncodeValue(&encoder, kProto3SingularMsgsField, options.proto3_singular_msgs);
  EncodeValue(&encoder, kSubmsgCallbackField, options.submsg_callback);
  EncodeValue(&encoder, kDefaultHasField, options.default_has);
  EncodeValue(&encoder, kIncludeField, options.include);
  EncodeValue(&encoder, kPackageField, options.package);
  EncodeValue(&encoder, kExcludeField, options.exclude);
  EncodeValue(&encoder, kTypeOverrideField, options.type_override);
  EncodeValue(&encoder, kSortByTagField, options.sort_by_tag);
  EncodeValue(&encoder, kFallbackTypeField, options.fallback_type);
  for (auto const& unknown : options.unknown_fields) {
    CHECK_OK(CheckUnknownField(unknown));
    encoder.EncodeRecord(FieldTag{.field_number = unknown.number, .wire_type = unknown.wire_type},
                         unknown.payload);
  }
  return std::move(encoder).Finish();
}

}  // namespace options
}  // namespace nanogen
