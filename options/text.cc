#include "options/text.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "options/effective.h"
#include "options/enums.h"
#include "options/field_table.h"
#include "options/options.h"
#include "proto/text_writer.h"
#include "proto/wire_format.h"

namespace nanogen {
namespace options {

namespace {

using ::nanogen::proto::TextWriter;

std::string_view FieldName(uint32_t const number) { return FindField(number)->name; }

std::string_view BoolText(bool const value) { return value ? "true" : "false"; }

std::string QuoteString(std::string_view const value) {
  return absl::StrCat("\"", absl::CEscape(value), "\"");
}

template <typename Enum>
std::string EnumText(EnumValue<Enum> const value) {
  auto const known = value.known();
  if (known.has_value()) {
    return std::string(EnumName(*known));
  } else {
    return absl::StrCat(value.raw());
  }
}

template <typename Integer, std::enable_if_t<util::IsIntegralStrictV<Integer>, bool> = true>
void WriteField(TextWriter* const writer, uint32_t const number,
                std::optional<Integer> const& value) {
  if (value.has_value()) {
    writer->AppendField(FieldName(number), *value);
  }
}

void WriteField(TextWriter* const writer, uint32_t const number, bool const value) {
  writer->AppendField(FieldName(number), BoolText(value));
}

void WriteField(TextWriter* const writer, uint32_t const number,
                std::optional<bool> const& value) {
  if (value.has_value()) {
    WriteField(writer, number, *value);
  }
}

void WriteField(TextWriter* const writer, uint32_t const number, std::string_view const value) {
  writer->AppendField(FieldName(number), QuoteString(value));
}

void WriteField(TextWriter* const writer, uint32_t const number,
                std::optional<std::string_view> const& value) {
  if (value.has_value()) {
    WriteField(writer, number, *value);
  }
}

void WriteField(TextWriter* const writer, uint32_t const number,
                std::vector<std::string_view> const& values) {
  for (auto const value : values) {
    WriteField(writer, number, value);
  }
}

template <typename Enum, std::enable_if_t<std::is_enum_v<Enum>, bool> = true>
void WriteField(TextWriter* const writer, uint32_t const number, Enum const value) {
  writer->AppendField(FieldName(number), EnumText(EnumValue<Enum>(value)));
}

template <typename Enum, std::enable_if_t<std::is_enum_v<Enum>, bool> = true>
void WriteField(TextWriter* const writer, uint32_t const number,
                std::optional<Enum> const& value) {
  if (value.has_value()) {
    WriteField(writer, number, *value);
  }
}

template <typename Enum>
void WriteField(TextWriter* const writer, uint32_t const number,
                std::optional<EnumValue<Enum>> const& value) {
  if (value.has_value()) {
    writer->AppendField(FieldName(number), EnumText(*value));
  }
}

void WriteUnknownField(TextWriter* const writer, UnknownField const& field) {
  auto const wire_type = proto::WireTypeName(field.wire_type);
  if (field.payload.empty()) {
    writer->AppendLine(field.number, ": ", wire_type);
  } else {
    writer->AppendLine(
        field.number, ": ", wire_type, " ",
        absl::BytesToHexString(std::string_view(
            reinterpret_cast<char const*>(field.payload.data()), field.payload.size())));
  }
}

void WriteOptions(TextWriter* const writer, Options const& options) {
  WriteField(writer, kMaxSizeField, options.max_size);
  WriteField(writer, kMaxLengthField, options.max_length);
  WriteField(writer, kMaxCountField, options.max_count);
  WriteField(writer, kIntSizeField, options.int_size);
  WriteField(writer, kTypeField, options.type);
  WriteField(writer, kLongNamesField, options.long_names);
  WriteField(writer, kPackedStructField, options.packed_struct);
  WriteField(writer, kPackedEnumField, options.packed_enum);
  WriteField(writer, kSkipMessageField, options.skip_message);
  WriteField(writer, kNoUnionsField, options.no_unions);
  WriteField(writer, kMsgIdField, options.msgid);
  WriteField(writer, kAnonymousOneofField, options.anonymous_oneof);
  WriteField(writer, kProto3Field, options.proto3);
  WriteField(writer, kProto3SingularMsgsField, options.proto3_singular_msgs);
  WriteField(writer, kEnumToStringField, options.enum_to_string);
  WriteField(writer, kFixedLengthField, options.fixed_length);
  WriteField(writer, kFixedCountField, options.fixed_count);
  WriteField(writer, kSubmsgCallbackField, options.submsg_callback);
  WriteField(writer, kMangleNamesField, options.mangle_names);
  WriteField(writer, kCallbackDatatypeField, options.callback_datatype);
  WriteField(writer, kCallbackFunctionField, options.callback_function);
  WriteField(writer, kDescriptorSizeField, options.descriptorsize);
  WriteField(writer, kDefaultHasField, options.default_has);
  WriteField(writer, kIncludeField, options.include);
  WriteField(writer, kExcludeField, options.exclude);
  WriteField(writer, kPackageField, options.package);
  WriteField(writer, kTypeOverrideField, options.type_override);
  WriteField(writer, kSortByTagField, options.sort_by_tag);
  WriteField(writer, kFallbackTypeField, options.fallback_type);
  for (auto const& field : options.unknown_fields) {
    WriteUnknownField(writer, field);
  }
}

void WriteEffectiveOptions(TextWriter* const writer, EffectiveOptions const& options) {
  WriteField(writer, kMaxSizeField, options.max_size);
  WriteField(writer, kMaxLengthField, options.max_length);
  WriteField(writer, kMaxCountField, options.max_count);
  WriteField(writer, kIntSizeField, options.int_size);
  WriteField(writer, kTypeField, options.type);
  WriteField(writer, kLongNamesField, options.long_names);
  WriteField(writer, kPackedStructField, options.packed_struct);
  WriteField(writer, kPackedEnumField, options.packed_enum);
  WriteField(writer, kSkipMessageField, options.skip_message);
  WriteField(writer, kNoUnionsField, options.no_unions);
  WriteField(writer, kMsgIdField, options.msgid);
  WriteField(writer, kAnonymousOneofField, options.anonymous_oneof);
  WriteField(writer, kProto3Field, options.proto3);
  WriteField(writer, kProto3SingularMsgsField, options.proto3_singular_msgs);
  WriteField(writer, kEnumToStringField, options.enum_to_string);
  WriteField(writer, kFixedLengthField, options.fixed_length);
  WriteField(writer, kFixedCountField, options.fixed_count);
  WriteField(writer, kSubmsgCallbackField, options.submsg_callback);
  WriteField(writer, kMangleNamesField, options.mangle_names);
  WriteField(writer, kCallbackDatatypeField, options.callback_datatype);
  WriteField(writer, kCallbackFunctionField, options.callback_function);
  WriteField(writer, kDescriptorSizeField, options.descriptorsize);
  WriteField(writer, kDefaultHasField, options.default_has);
  WriteField(writer, kIncludeField, options.include);
  WriteField(writer, kExcludeField, options.exclude);
  WriteField(writer, kPackageField, options.package);
  WriteField(writer, kTypeOverrideField, options.type_override);
  WriteField(writer, kSortByTagField, options.sort_by_tag);
  WriteField(writer, kFallbackTypeField, options.fallback_type);
}

}  // namespace

std::string ToText(Options const& options) {
  TextWriter writer;
  WriteOptions(&writer, options);
  return std::move(writer).Finish();
}

std::string ToText(ScopedOptions const& options) {
  TextWriter writer;
  {
    TextWriter::Block block{&writer, ScopeName(options.scope)};
    WriteOptions(&writer, options.options);
  }
  return std::move(writer).Finish();
}

std::string ToText(EffectiveOptions const& options) {
  TextWriter writer;
  WriteEffectiveOptions(&writer, options);
  return std::move(writer).Finish();
}

std::string ToText(Scope const scope, EffectiveOptions const& options) {
  TextWriter writer;
  {
    TextWriter::Block block{&writer, ScopeName(scope)};
    WriteEffectiveOptions(&writer, options);
  }
  return std::move(writer).Finish();
}

}  // namespace options
}  // namespace nanogen
