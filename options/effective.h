#ifndef __NANOGEN_OPTIONS_EFFECTIVE_H__
#define __NANOGEN_OPTIONS_EFFECTIVE_H__

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "options/enums.h"
#include "options/options.h"

namespace nanogen {
namespace options {

// The kind of schema element an options message is attached to. Options attached to an outer
// element apply to all the elements it contains unless they're overridden.
enum class Scope {
  kFile = 0,
  kMessage = 1,
  kField = 2,
};

std::string_view ScopeName(Scope scope);

bool AbslParseFlag(std::string_view text, Scope* scope, std::string* error);
std::string AbslUnparseFlag(Scope scope);

struct ScopedOptions {
  Scope scope;
  Options options;
};

// What to do with enumeration values that aren't declared by this version of the code.
enum class UnrecognizedEnumPolicy {
  // Ignore the value and use the field default.
  kTreatAsAbsent,

  // Fail the resolution.
  kReject,
};

// Options with the defaults applied. Fields that don't have a default stay optional.
struct EffectiveOptions {
  auto tie() const {
    return std::tie(max_size, max_length, max_count, int_size, type, long_names, packed_struct,
                    packed_enum, skip_message, no_unions, msgid, anonymous_oneof, proto3,
                    proto3_singular_msgs, enum_to_string, fixed_length, fixed_count,
                    submsg_callback, mangle_names, callback_datatype, callback_function,
                    descriptorsize, default_has, include, exclude, package, type_override,
                    sort_by_tag, fallback_type);
  }

  friend bool operator==(EffectiveOptions const& lhs, EffectiveOptions const& rhs) {
    return lhs.tie() == rhs.tie();
  }

  friend bool operator!=(EffectiveOptions const& lhs, EffectiveOptions const& rhs) {
    return lhs.tie() != rhs.tie();
  }

  std::optional<int32_t> max_size;
  std::optional<int32_t> max_length;
  std::optional<int32_t> max_count;
  IntSize int_size;
  FieldType type;
  bool long_names;
  bool packed_struct;
  bool packed_enum;
  bool skip_message;
  bool no_unions;
  std::optional<uint32_t> msgid;
  bool anonymous_oneof;
  bool proto3;
  bool proto3_singular_msgs;
  bool enum_to_string;
  bool fixed_length;
  bool fixed_count;
  bool submsg_callback;
  TypenameMangling mangle_names;
  std::string_view callback_datatype;
  std::string_view callback_function;
  DescriptorSize descriptorsize;
  bool default_has;
  std::vector<std::string_view> include;
  std::vector<std::string_view> exclude;
  std::optional<std::string_view> package;
  std::optional<FieldDescriptorType> type_override;
  bool sort_by_tag;
  FieldType fallback_type;
};

// Substitutes the field defaults for the absent fields of `options`. The returned strings are
// views into `options` or static storage.
//
// Consistency between related fields (e.g. `max_length` vs `max_size`) is not checked: values are
// reported as given.
absl::StatusOr<EffectiveOptions> Resolve(
    Options const& options,
    UnrecognizedEnumPolicy policy = UnrecognizedEnumPolicy::kTreatAsAbsent);

// Merges the options of an inner element over those of its enclosing element. Scalars present in
// `inner` override `outer`, repeated fields and unknown fields are concatenated with the `outer`
// elements first. The result is the same as decoding the concatenation of the two encodings.
Options MergeScopes(Options const& outer, Options const& inner);

// Merges a chain of scoped options from the outermost to the innermost. The scopes must be sorted
// from file to field; several consecutive message scopes are allowed because messages nest.
absl::StatusOr<Options> MergeScopeChain(absl::Span<ScopedOptions const> chain);

}  // namespace options
}  // namespace nanogen

#endif  // __NANOGEN_OPTIONS_EFFECTIVE_H__
