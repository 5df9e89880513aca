#ifndef __NANOGEN_OPTIONS_FIELD_TABLE_H__
#define __NANOGEN_OPTIONS_FIELD_TABLE_H__

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

#include "common/utilities.h"
#include "options/enums.h"
#include "proto/wire_format.h"

namespace nanogen {
namespace options {

enum class FieldKind {
  kInt32,
  kUInt32,
  kBool,
  kEnum,
  kString,
  kRepeatedString,
};

// Default of a field: none, a boolean, an enumeration discriminant, or a string literal.
using DefaultValue = std::variant<std::monostate, bool, int32_t, std::string_view>;

struct FieldInfo {
  uint32_t number;
  std::string_view name;
  FieldKind kind;
  DefaultValue default_value;
};

inline uint32_t constexpr kMaxSizeField = 1;
inline uint32_t constexpr kMaxCountField = 2;
inline uint32_t constexpr kTypeField = 3;
inline uint32_t constexpr kLongNamesField = 4;
inline uint32_t constexpr kPackedStructField = 5;
inline uint32_t constexpr kSkipMessageField = 6;
inline uint32_t constexpr kIntSizeField = 7;
inline uint32_t constexpr kNoUnionsField = 8;
inline uint32_t constexpr kMsgIdField = 9;
inline uint32_t constexpr kPackedEnumField = 10;
inline uint32_t constexpr kAnonymousOneofField = 11;
inline uint32_t constexpr kProto3Field = 12;
inline uint32_t constexpr kEnumToStringField = 13;
inline uint32_t constexpr kMaxLengthField = 14;
inline uint32_t constexpr kFixedLengthField = 15;
inline uint32_t constexpr kFixedCountField = 16;
inline uint32_t constexpr kMangleNamesField = 17;
inline uint32_t constexpr kCallbackDatatypeField = 18;
inline uint32_t constexpr kCallbackFunctionField = 19;
inline uint32_t constexpr kDescriptorSizeField = 20;
inline uint32_t constexpr kProto3SingularMsgsField = 21;
inline uint32_t constexpr kSubmsgCallbackField = 22;
inline uint32_t constexpr kDefaultHasField = 23;
inline uint32_t constexpr kIncludeField = 24;
inline uint32_t constexpr kPackageField = 25;
inline uint32_t constexpr kExcludeField = 26;
inline uint32_t constexpr kTypeOverrideField = 27;
inline uint32_t constexpr kSortByTagField = 28;
inline uint32_t constexpr kFallbackTypeField = 29;

// All the known fields in declaration order. This table decides how each record is dispatched
// during decoding and provides the defaults used by the resolution step. Defaults are attached to
// fields rather than to enumeration types: `type` and `fallback_type` are both `FieldType` but
// default to different values.
inline auto constexpr kOptionsFields = std::array<FieldInfo, 29>{{
    {kMaxSizeField, "max_size", FieldKind::kInt32, std::monostate{}},
    {kMaxLengthField, "max_length", FieldKind::kInt32, std::monostate{}},
    {kMaxCountField, "max_count", FieldKind::kInt32, std::monostate{}},
    {kIntSizeField, "int_size", FieldKind::kEnum, util::to_underlying(IntSize::IS_DEFAULT)},
    {kTypeField, "type", FieldKind::kEnum, util::to_underlying(FieldType::FT_DEFAULT)},
    {kLongNamesField, "long_names", FieldKind::kBool, true},
    {kPackedStructField, "packed_struct", FieldKind::kBool, false},
    {kPackedEnumField, "packed_enum", FieldKind::kBool, false},
    {kSkipMessageField, "skip_message", FieldKind::kBool, false},
    {kNoUnionsField, "no_unions", FieldKind::kBool, false},
    {kMsgIdField, "msgid", FieldKind::kUInt32, std::monostate{}},
    {kAnonymousOneofField, "anonymous_oneof", FieldKind::kBool, false},
    {kProto3Field, "proto3", FieldKind::kBool, false},
    {kProto3SingularMsgsField, "proto3_singular_msgs", FieldKind::kBool, false},
    {kEnumToStringField, "enum_to_string", FieldKind::kBool, false},
    {kFixedLengthField, "fixed_length", FieldKind::kBool, false},
    {kFixedCountField, "fixed_count", FieldKind::kBool, false},
    {kSubmsgCallbackField, "submsg_callback", FieldKind::kBool, false},
    {kMangleNamesField, "mangle_names", FieldKind::kEnum,
     util::to_underlying(TypenameMangling::M_NONE)},
    {kCallbackDatatypeField, "callback_datatype", FieldKind::kString,
     std::string_view("pb_callback_t")},
    {kCallbackFunctionField, "callback_function", FieldKind::kString,
     std::string_view("pb_default_field_callback")},
    {kDescriptorSizeField, "descriptorsize", FieldKind::kEnum,
     util::to_underlying(DescriptorSize::DS_AUTO)},
    {kDefaultHasField, "default_has", FieldKind::kBool, false},
    {kIncludeField, "include", FieldKind::kRepeatedString, std::monostate{}},
    {kExcludeField, "exclude", FieldKind::kRepeatedString, std::monostate{}},
    {kPackageField, "package", FieldKind::kString, std::monostate{}},
    {kTypeOverrideField, "type_override", FieldKind::kEnum, std::monostate{}},
    {kSortByTagField, "sort_by_tag", FieldKind::kBool, true},
    {kFallbackTypeField, "fallback_type", FieldKind::kEnum,
     util::to_underlying(FieldType::FT_CALLBACK)},
}};

// Returns the table entry for the field with the given number, or nullptr if the field is unknown.
constexpr FieldInfo const* FindField(uint64_t const number) {
  for (auto const& field : kOptionsFields) {
    if (field.number == number) {
      return &field;
    }
  }
  return nullptr;
}

// Returns the wire type a record of a field of the given kind must have.
constexpr proto::WireType ExpectedWireType(FieldKind const kind) {
  switch (kind) {
    case FieldKind::kString:
    case FieldKind::kRepeatedString:
      return proto::WireType::kLength;
    default:
      return proto::WireType::kVarInt;
  }
}

// Compile-time access to the typed default of a known field. `Value` must match the field's
// `DefaultValue` alternative: `bool`, `int32_t` (enumeration discriminants), or `std::string_view`.
template <typename Value>
constexpr Value FieldDefault(uint32_t const number) {
  return std::get<Value>(FindField(number)->default_value);
}

}  // namespace options
}  // namespace nanogen

#endif  // __NANOGEN_OPTIONS_FIELD_TABLE_H__
