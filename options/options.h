#ifndef __NANOGEN_OPTIONS_OPTIONS_H__
#define __NANOGEN_OPTIONS_OPTIONS_H__

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "io/cord.h"
#include "options/enums.h"
#include "proto/wire_format.h"

namespace nanogen {
namespace options {

// A record whose field number isn't in the options field table. `payload` holds the bytes that
// followed the tag: the varint bytes as they appeared for varint records, 4 or 8 bytes for fixed32
// and fixed64 records, the content (without the length prefix) for length-delimited records, and
// the nested records (without the end-group tag) for groups.
//
// Entries returned by `Options::Decode` are always well-formed. Hand-built entries must pass
// `CheckUnknownField` before being encoded.
struct UnknownField {
  auto tie() const { return std::tie(number, wire_type, payload); }

  friend bool operator==(UnknownField const& lhs, UnknownField const& rhs) {
    return lhs.tie() == rhs.tie();
  }

  friend bool operator!=(UnknownField const& lhs, UnknownField const& rhs) {
    return lhs.tie() != rhs.tie();
  }

  uint64_t number;
  proto::WireType wire_type;
  absl::Span<uint8_t const> payload;
};

// Returns `InvalidArgument` if `field` wouldn't decode back to itself: its number belongs to a
// known field or doesn't fit in a tag, or its payload isn't exactly one well-formed record body of
// its wire type.
absl::Status CheckUnknownField(UnknownField const& field);

// The code generator options message, as attached to a file, message, or field definition.
//
// Every scalar field tracks presence separately from its value: an absent field and a field
// explicitly set to its default are different states and encode differently. Defaults are never
// applied here, see `Resolve` in `options/effective.h` for that.
//
// Decoded strings and unknown-field payloads are views into the decoded buffer, so a decoded
// `Options` must not outlive it. Use `OwnedOptions` to detach.
struct Options {
  // Decodes a serialized options message. Fails with `InvalidArgument` and a `proto::DecodeError`
  // payload on malformed input; no partial result is ever returned.
  static absl::StatusOr<Options> Decode(absl::Span<uint8_t const> data);

  // Encodes `options`. Known fields come first in ascending field number order, followed by the
  // unknown fields in their stored order.
  //
  // CHECK-fails if an unknown field doesn't pass `CheckUnknownField`.
  static nanogen::io::Cord Encode(Options const& options);

  auto tie() const {
    return std::tie(max_size, max_length, max_count, int_size, type, long_names, packed_struct,
                    packed_enum, skip_message, no_unions, msgid, anonymous_oneof, proto3,
                    proto3_singular_msgs, enum_to_string, fixed_length, fixed_count,
                    submsg_callback, mangle_names, callback_datatype, callback_function,
                    descriptorsize, default_has, include, exclude, package, type_override,
                    sort_by_tag, fallback_type, unknown_fields);
  }

  friend bool operator==(Options const& lhs, Options const& rhs) { return lhs.tie() == rhs.tie(); }
  friend bool operator!=(Options const& lhs, Options const& rhs) { return lhs.tie() != rhs.tie(); }

  // Allocated size of strings and bytes.
  std::optional<int32_t> max_size;

  // Max length of strings, excluding the terminating null.
  std::optional<int32_t> max_length;

  // Allocated number of entries in arrays.
  std::optional<int32_t> max_count;

  // Size of integer fields.
  std::optional<EnumValue<IntSize>> int_size;

  // Force type of field (callback or static allocation).
  std::optional<EnumValue<FieldType>> type;

  // Use long names for enums, i.e. EnumName_EnumValue.
  std::optional<bool> long_names;

  // Add 'packed' attribute to generated structs.
  std::optional<bool> packed_struct;

  // Add 'packed' attribute to generated enums.
  std::optional<bool> packed_enum;

  // Skip this message.
  std::optional<bool> skip_message;

  // Generate oneofs as normal optional fields instead of unions.
  std::optional<bool> no_unions;

  std::optional<uint32_t> msgid;

  // Decode oneof as anonymous union.
  std::optional<bool> anonymous_oneof;

  // Proto3 singular field does not generate a "has_" flag.
  std::optional<bool> proto3;

  // Force proto3 submessages to have no "has_" flag either.
  std::optional<bool> proto3_singular_msgs;

  // Generate an enum->string mapping function (can take up lots of space).
  std::optional<bool> enum_to_string;

  // Generate bytes arrays with fixed length.
  std::optional<bool> fixed_length;

  // Generate repeated field with fixed count.
  std::optional<bool> fixed_count;

  // Generate message-level callback that is called before decoding submessages.
  std::optional<bool> submsg_callback;

  // Shorten or remove package names from type names.
  std::optional<EnumValue<TypenameMangling>> mangle_names;

  // Data type for storage associated with callback fields.
  std::optional<std::string_view> callback_datatype;

  // Callback function used for encoding and decoding.
  std::optional<std::string_view> callback_function;

  // Select the size of field descriptors.
  std::optional<EnumValue<DescriptorSize>> descriptorsize;

  // Set default value for has_ fields.
  std::optional<bool> default_has;

  // Extra files to include in generated `.pb.h`, in order.
  std::vector<std::string_view> include;

  // Automatic includes to exclude from generated `.pb.h`, in order.
  std::vector<std::string_view> exclude;

  // Package name that applies only for the generated code.
  std::optional<std::string_view> package;

  // Override type of the field in the generated code.
  std::optional<EnumValue<FieldDescriptorType>> type_override;

  // Sort fields by tag number in the generated code.
  std::optional<bool> sort_by_tag;

  // Type used for fields that would otherwise be unsupported.
  std::optional<EnumValue<FieldType>> fallback_type;

  // Records with unknown field numbers, in the order they were encountered.
  std::vector<UnknownField> unknown_fields;
};

}  // namespace options
}  // namespace nanogen

#endif  // __NANOGEN_OPTIONS_OPTIONS_H__
