#ifndef __NANOGEN_COMMON_UTILITIES_H__
#define __NANOGEN_COMMON_UTILITIES_H__

#include <type_traits>
#include <utility>  // IWYU pragma: keep

#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Marks raw pointers that own their pointee, see
// https://clang.llvm.org/extra/clang-tidy/checks/cppcoreguidelines/owning-memory.html.
namespace gsl {
template <typename T, std::enable_if_t<std::is_pointer_v<T>, bool> = true>
using owner = T;
}  // namespace gsl

namespace nanogen {
namespace util {

// Converts an enumerator to its underlying integer, like C++23's `std::to_underlying`.
template <typename Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum const value) {
  return static_cast<std::underlying_type_t<Enum>>(value);
}

// True for integral types other than `bool`.
template <typename Type>
struct IsIntegralStrict
    : public std::bool_constant<std::is_integral_v<Type> && !std::is_same_v<Type, bool>> {};

template <typename Type>
inline bool constexpr IsIntegralStrictV = IsIntegralStrict<Type>::value;

namespace internal {

inline absl::Status GetStatus(absl::Status const& status) { return status; }

template <typename Value>
inline absl::Status GetStatus(absl::StatusOr<Value> const& status_or) {
  return status_or.status();
}

}  // namespace internal

}  // namespace util
}  // namespace nanogen

// Returns the status of `expression` from the enclosing function if it's an error. `expression`
// may yield either an `absl::Status` or an `absl::StatusOr`; in the latter case the value is
// discarded.
//
//   absl::Status Decode() {
//     RETURN_IF_ERROR(CheckHeader());
//     return absl::OkStatus();
//   }
#define RETURN_IF_ERROR(expression)                                 \
  do {                                                              \
    auto status_or_value = (expression);                            \
    if (!status_or_value.ok()) {                                    \
      return ::nanogen::util::internal::GetStatus(status_or_value); \
    }                                                               \
  } while (false)

// Evaluates `expression`, which must yield an `absl::StatusOr`, returns its status from the
// enclosing function if it's an error, and otherwise binds a mutable reference called `name` to
// the contained value.
//
//   absl::StatusOr<Options> Decode(absl::Span<uint8_t const> data) {
//     DEFINE_VAR_OR_RETURN(options, Parse(data));
//     options.Normalize();
//     return options;
//   }
//
// The `absl::StatusOr` itself is kept in a variable called `status_or_<name>`.
#define DEFINE_VAR_OR_RETURN(name, expression)   \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto& name = status_or_##name.value();

// Same as `DEFINE_VAR_OR_RETURN`, binding a const reference instead.
#define DEFINE_CONST_OR_RETURN(name, expression) \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto const& name = status_or_##name.value();

#endif  // __NANOGEN_COMMON_UTILITIES_H__
