#include "options/effective.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "options/enums.h"
#include "options/field_table.h"
#include "options/options.h"

namespace nanogen {
namespace options {

namespace {

template <typename Value>
void MergeField(std::optional<Value>* const outer, std::optional<Value> const& inner) {
  if (inner.has_value()) {
    *outer = inner;
  }
}

template <typename Value>
void MergeField(std::vector<Value>* const outer, std::vector<Value> const& inner) {
  outer->insert(outer->end(), inner.begin(), inner.end());
}

absl::Status UnrecognizedEnumError(uint32_t const number, int32_t const raw) {
  return absl::InvalidArgumentError(absl::StrCat("unrecognized value ", raw, " for field \"",
                                                 FindField(number)->name, "\""));
}

template <typename Enum>
absl::StatusOr<std::optional<Enum>> ResolveEnum(std::optional<EnumValue<Enum>> const& field,
                                                uint32_t const number,
                                                UnrecognizedEnumPolicy const policy) {
  if (!field.has_value()) {
    return std::optional<Enum>();
  }
  auto const known = field->known();
  if (!known.has_value() && policy == UnrecognizedEnumPolicy::kReject) {
    return UnrecognizedEnumError(number, field->raw());
  }
  return known;
}

template <typename Enum>
absl::StatusOr<Enum> ResolveEnumOrDefault(std::optional<EnumValue<Enum>> const& field,
                                          uint32_t const number,
                                          UnrecognizedEnumPolicy const policy) {
  DEFINE_CONST_OR_RETURN(value, ResolveEnum(field, number, policy));
  return value.value_or(static_cast<Enum>(FieldDefault<int32_t>(number)));
}

bool ResolveBool(std::optional<bool> const& field, uint32_t const number) {
  return field.value_or(FieldDefault<bool>(number));
}

std::string_view ResolveString(std::optional<std::string_view> const& field,
                               uint32_t const number) {
  return field.value_or(FieldDefault<std::string_view>(number));
}

}  // namespace

std::string_view ScopeName(Scope const scope) {
  switch (scope) {
    case Scope::kFile:
      return "file";
    case Scope::kMessage:
      return "message";
    case Scope::kField:
      return "field";
    default:
      return "invalid";
  }
}

bool AbslParseFlag(std::string_view const text, Scope* const scope, std::string* const error) {
  for (auto const value : {Scope::kFile, Scope::kMessage, Scope::kField}) {
    if (text == ScopeName(value)) {
      *scope = value;
      return true;
    }
  }
  *error = absl::StrCat("invalid scope \"", text, "\", must be one of: file, message, field");
  return false;
}

std::string AbslUnparseFlag(Scope const scope) { return std::string(ScopeName(scope)); }

absl::StatusOr<EffectiveOptions> Resolve(Options const& options,
                                         UnrecognizedEnumPolicy const policy) {
  EffectiveOptions effective;
  effective.max_size = options.max_size;
  effective.max_length = options.max_length;
  effective.max_count = options.max_count;
  DEFINE_CONST_OR_RETURN(int_size, ResolveEnumOrDefault(options.int_size, kIntSizeField, policy));
  effective.int_size = int_size;
  DEFINE_CONST_OR_RETURN(type, ResolveEnumOrDefault(options.type, kTypeField, policy));
  effective.type = type;
  effective.long_names = ResolveBool(options.long_names, kLongNamesField);
  effective.packed_struct = ResolveBool(options.packed_struct, kPackedStructField);
  effective.packed_enum = ResolveBool(options.packed_enum, kPackedEnumField);
  effective.skip_message = ResolveBool(options.skip_message, kSkipMessageField);
  effective.no_unions = ResolveBool(options.no_unions, kNoUnionsField);
  effective.msgid = options.msgid;
  effective.anonymous_oneof = ResolveBool(options.anonymous_oneof, kAnonymousOneofField);
  effective.proto3 = ResolveBool(options.proto3, kProto3Field);
  effective.proto3_singular_msgs =
      ResolveBool(options.proto3_singular_msgs, kProto3SingularMsgsField);
  effective.enum_to_string = ResolveBool(options.enum_to_string, kEnumToStringField);
  effective.fixed_length = ResolveBool(options.fixed_length, kFixedLengthField);
  effective.fixed_count = ResolveBool(options.fixed_count, kFixedCountField);
  effective.submsg_callback = ResolveBool(options.submsg_callback, kSubmsgCallbackField);
  DEFINE_CONST_OR_RETURN(mangle_names,
                         ResolveEnumOrDefault(options.mangle_names, kMangleNamesField, policy));
  effective.mangle_names = mangle_names;
  effective.callback_datatype = ResolveString(options.callback_datatype, kCallbackDatatypeField);
  effective.callback_function = ResolveString(options.callback_function, kCallbackFunctionField);
  DEFINE_CONST_OR_RETURN(
      descriptorsize, ResolveEnumOrDefault(options.descriptorsize, kDescriptorSizeField, policy));
  effective.descriptorsize = descriptorsize;
  effective.default_has = ResolveBool(options.default_has, kDefaultHasField);
  effective.include = options.include;
  effective.exclude = options.exclude;
  effective.package = options.package;
  DEFINE_CONST_OR_RETURN(type_override,
                         ResolveEnum(options.type_override, kTypeOverrideField, policy));
  effective.type_override = type_override;
  effective.sort_by_tag = ResolveBool(options.sort_by_tag, kSortByTagField);
  DEFINE_CONST_OR_RETURN(fallback_type,
                         ResolveEnumOrDefault(options.fallback_type, kFallbackTypeField, policy));
  effective.fallback_type = fallback_type;
  return effective;
}

Options MergeScopes(Options const& outer, Options const& inner) {
  Options merged = outer;
  MergeField(&merged.max_size, inner.max_size);
  MergeField(&merged.max_length, inner.max_length);
  MergeField(&merged.max_count, inner.max_count);
  MergeField(&merged.int_size, inner.int_size);
  MergeField(&merged.type, inner.type);
  MergeField(&merged.long_names, inner.long_names);
  MergeField(&merged.packed_struct, inner.packed_struct);
  MergeField(&merged.packed_enum, inner.packed_enum);
  MergeField(&merged.skip_message, inner.skip_message);
  MergeField(&merged.no_unions, inner.no_unions);
  MergeField(&merged.msgid, inner.msgid);
  MergeField(&merged.anonymous_oneof, inner.anonymous_oneof);
  MergeField(&merged.proto3, inner.proto3);
  MergeField(&merged.proto3_singular_msgs, inner.proto3_singular_msgs);
  MergeField(&merged.enum_to_string, inner.enum_to_string);
  MergeField(&merged.fixed_length, inner.fixed_length);
  MergeField(&merged.fixed_count, inner.fixed_count);
  MergeField(&merged.submsg_callback, inner.submsg_callback);
  MergeField(&merged.mangle_names, inner.mangle_names);
  MergeField(&merged.callback_datatype, inner.callback_datatype);
  MergeField(&merged.callback_function, inner.callback_function);
  MergeField(&merged.descriptorsize, inner.descriptorsize);
  MergeField(&merged.default_has, inner.default_has);
  MergeField(&merged.include, inner.include);
  MergeField(&merged.exclude, inner.exclude);
  MergeField(&merged.package, inner.package);
  MergeField(&merged.type_override, inner.type_override);
  MergeField(&merged.sort_by_tag, inner.sort_by_tag);
  MergeField(&merged.fallback_type, inner.fallback_type);
  MergeField(&merged.unknown_fields, inner.unknown_fields);
  return merged;
}

absl::StatusOr<Options> MergeScopeChain(absl::Span<ScopedOptions const> const chain) {
  Options merged;
  std::optional<Scope> previous;
  for (auto const& [scope, options] : chain) {
    if (previous.has_value()) {
      if (scope < *previous) {
        return absl::InvalidArgumentError(absl::StrCat(
            "options for scope \"", ScopeName(scope), "\" can't be nested in scope \"",
            ScopeName(*previous), "\""));
      }
      if (scope == *previous && scope != Scope::kMessage) {
        return absl::InvalidArgumentError(
            absl::StrCat("duplicate options for scope \"", ScopeName(scope), "\""));
      }
    }
    merged = MergeScopes(merged, options);
    previous = scope;
  }
  return merged;
}

}  // namespace options
}  // namespace nanogen
