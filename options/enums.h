#ifndef __NANOGEN_OPTIONS_ENUMS_H__
#define __NANOGEN_OPTIONS_ENUMS_H__

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "common/utilities.h"

namespace nanogen {
namespace options {

// Storage strategy of a generated field.
enum class FieldType : int32_t {
  // Automatically decide field type, generate static field if possible.
  FT_DEFAULT = 0,
  // Always generate a callback field.
  FT_CALLBACK = 1,
  // Always generate a dynamically allocated field.
  FT_POINTER = 4,
  // Generate a static field or raise an exception if not possible.
  FT_STATIC = 2,
  // Ignore the field completely.
  FT_IGNORE = 3,
  // Legacy option, use the separate `fixed_length` option instead.
  FT_INLINE = 5,
};

// Width of generated integer fields.
enum class IntSize : int32_t {
  // 32 or 64 bits based on the type in the schema.
  IS_DEFAULT = 0,
  IS_8 = 8,
  IS_16 = 16,
  IS_32 = 32,
  IS_64 = 64,
};

// How package names are shortened in generated type names. File scope only.
enum class TypenameMangling : int32_t {
  M_NONE = 0,
  M_STRIP_PACKAGE = 1,
  M_FLATTEN = 2,
  M_PACKAGE_INITIALS = 3,
};

// Size of the generated field descriptors, in words.
enum class DescriptorSize : int32_t {
  // Select minimal size based on field type.
  DS_AUTO = 0,
  // Up to 15 byte fields, no arrays.
  DS_1 = 1,
  // Up to 4095 byte fields, 4095 entry arrays.
  DS_2 = 2,
  // Up to 2^32-1 byte fields, 2^16-1 entry arrays.
  DS_4 = 4,
  // Up to 2^32-1 entry arrays.
  DS_8 = 8,
};

// Field types of the host schema, as used by `type_override`.
enum class FieldDescriptorType : int32_t {
  TYPE_DOUBLE = 1,
  TYPE_FLOAT = 2,
  TYPE_INT64 = 3,
  TYPE_UINT64 = 4,
  TYPE_INT32 = 5,
  TYPE_FIXED64 = 6,
  TYPE_FIXED32 = 7,
  TYPE_BOOL = 8,
  TYPE_STRING = 9,
  TYPE_GROUP = 10,
  TYPE_MESSAGE = 11,
  TYPE_BYTES = 12,
  TYPE_UINT32 = 13,
  TYPE_ENUM = 14,
  TYPE_SFIXED32 = 15,
  TYPE_SFIXED64 = 16,
  TYPE_SINT32 = 17,
  TYPE_SINT64 = 18,
};

// Lists the declared values of each enumeration along with their canonical names.
template <typename Enum>
struct EnumTraits;

template <>
struct EnumTraits<FieldType> {
  static inline auto constexpr kValues = std::array<std::pair<FieldType, std::string_view>, 6>{{
      {FieldType::FT_DEFAULT, "FT_DEFAULT"},
      {FieldType::FT_CALLBACK, "FT_CALLBACK"},
      {FieldType::FT_POINTER, "FT_POINTER"},
      {FieldType::FT_STATIC, "FT_STATIC"},
      {FieldType::FT_IGNORE, "FT_IGNORE"},
      {FieldType::FT_INLINE, "FT_INLINE"},
  }};
};

template <>
struct EnumTraits<IntSize> {
  static inline auto constexpr kValues = std::array<std::pair<IntSize, std::string_view>, 5>{{
      {IntSize::IS_DEFAULT, "IS_DEFAULT"},
      {IntSize::IS_8, "IS_8"},
      {IntSize::IS_16, "IS_16"},
      {IntSize::IS_32, "IS_32"},
      {IntSize::IS_64, "IS_64"},
  }};
};

template <>
struct EnumTraits<TypenameMangling> {
  static inline auto constexpr kValues =
      std::array<std::pair<TypenameMangling, std::string_view>, 4>{{
          {TypenameMangling::M_NONE, "M_NONE"},
          {TypenameMangling::M_STRIP_PACKAGE, "M_STRIP_PACKAGE"},
          {TypenameMangling::M_FLATTEN, "M_FLATTEN"},
          {TypenameMangling::M_PACKAGE_INITIALS, "M_PACKAGE_INITIALS"},
      }};
};

template <>
struct EnumTraits<DescriptorSize> {
  static inline auto constexpr kValues =
      std::array<std::pair<DescriptorSize, std::string_view>, 5>{{
          {DescriptorSize::DS_AUTO, "DS_AUTO"},
          {DescriptorSize::DS_1, "DS_1"},
          {DescriptorSize::DS_2, "DS_2"},
          {DescriptorSize::DS_4, "DS_4"},
          {DescriptorSize::DS_8, "DS_8"},
      }};
};

template <>
struct EnumTraits<FieldDescriptorType> {
  static inline auto constexpr kValues =
      std::array<std::pair<FieldDescriptorType, std::string_view>, 18>{{
          {FieldDescriptorType::TYPE_DOUBLE, "TYPE_DOUBLE"},
          {FieldDescriptorType::TYPE_FLOAT, "TYPE_FLOAT"},
          {FieldDescriptorType::TYPE_INT64, "TYPE_INT64"},
          {FieldDescriptorType::TYPE_UINT64, "TYPE_UINT64"},
          {FieldDescriptorType::TYPE_INT32, "TYPE_INT32"},
          {FieldDescriptorType::TYPE_FIXED64, "TYPE_FIXED64"},
          {FieldDescriptorType::TYPE_FIXED32, "TYPE_FIXED32"},
          {FieldDescriptorType::TYPE_BOOL, "TYPE_BOOL"},
          {FieldDescriptorType::TYPE_STRING, "TYPE_STRING"},
          {FieldDescriptorType::TYPE_GROUP, "TYPE_GROUP"},
          {FieldDescriptorType::TYPE_MESSAGE, "TYPE_MESSAGE"},
          {FieldDescriptorType::TYPE_BYTES, "TYPE_BYTES"},
          {FieldDescriptorType::TYPE_UINT32, "TYPE_UINT32"},
          {FieldDescriptorType::TYPE_ENUM, "TYPE_ENUM"},
          {FieldDescriptorType::TYPE_SFIXED32, "TYPE_SFIXED32"},
          {FieldDescriptorType::TYPE_SFIXED64, "TYPE_SFIXED64"},
          {FieldDescriptorType::TYPE_SINT32, "TYPE_SINT32"},
          {FieldDescriptorType::TYPE_SINT64, "TYPE_SINT64"},
      }};
};

// Returns the canonical name of `value`, or an empty string if `value` is not a declared value.
template <typename Enum>
constexpr std::string_view EnumName(Enum const value) {
  for (auto const& [declared, name] : EnumTraits<Enum>::kValues) {
    if (declared == value) {
      return name;
    }
  }
  return "";
}

// Looks up an enumeration value by its canonical name.
template <typename Enum>
constexpr std::optional<Enum> ParseEnumName(std::string_view const name) {
  for (auto const& [declared, declared_name] : EnumTraits<Enum>::kValues) {
    if (declared_name == name) {
      return declared;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr bool IsDeclaredEnumValue(int32_t const raw) {
  for (auto const& [declared, unused_name] : EnumTraits<Enum>::kValues) {
    if (util::to_underlying(declared) == raw) {
      return true;
    }
  }
  return false;
}

// The value of an enumeration field as it appeared on the wire. A value that isn't declared by
// `Enum` is retained as an unrecognized raw integer rather than being rejected or coerced, so that
// producers can use enumeration values this code doesn't know about yet.
template <typename Enum>
class EnumValue {
 public:
  // NOLINTNEXTLINE(google-explicit-constructor)
  constexpr EnumValue(Enum const value) : raw_(util::to_underlying(value)) {}

  static constexpr EnumValue FromRaw(int32_t const raw) {
    EnumValue value{Enum{}};
    value.raw_ = raw;
    return value;
  }

  constexpr EnumValue(EnumValue const&) = default;
  constexpr EnumValue& operator=(EnumValue const&) = default;

  constexpr bool is_known() const { return IsDeclaredEnumValue<Enum>(raw_); }

  // Returns the declared value, or an empty optional if the value is unrecognized.
  constexpr std::optional<Enum> known() const {
    if (is_known()) {
      return static_cast<Enum>(raw_);
    } else {
      return std::nullopt;
    }
  }

  constexpr int32_t raw() const { return raw_; }

  friend constexpr bool operator==(EnumValue const lhs, EnumValue const rhs) {
    return lhs.raw_ == rhs.raw_;
  }

  friend constexpr bool operator!=(EnumValue const lhs, EnumValue const rhs) {
    return lhs.raw_ != rhs.raw_;
  }

  friend constexpr bool operator<(EnumValue const lhs, EnumValue const rhs) {
    return lhs.raw_ < rhs.raw_;
  }

  template <typename H>
  friend H AbslHashValue(H h, EnumValue const value) {
    return H::combine(std::move(h), value.raw_);
  }

  friend std::ostream& operator<<(std::ostream& os, EnumValue const value) {
    if (value.is_known()) {
      return os << EnumName(static_cast<Enum>(value.raw_));
    } else {
      return os << "unrecognized(" << value.raw_ << ")";
    }
  }

 private:
  int32_t raw_;
};

}  // namespace options
}  // namespace nanogen

#endif  // __NANOGEN_OPTIONS_ENUMS_H__
