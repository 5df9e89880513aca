#ifndef __NANOGEN_OPTIONS_OWNED_OPTIONS_H__
#define __NANOGEN_OPTIONS_OWNED_OPTIONS_H__

#include <cstdint>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "io/buffer.h"
#include "options/options.h"

namespace nanogen {
namespace options {

// Owning counterpart of `Options`. All the strings and unknown-field payloads are copied into a
// single arena owned by this object, so the wrapped `Options` stays valid after the buffer it was
// decoded from is released.
//
// Copies copy the arena. Moves are cheap and don't invalidate views obtained from `options()`
// because the arena memory doesn't move.
class OwnedOptions {
 public:
  // Decodes `data` after copying it into the arena.
  static absl::StatusOr<OwnedOptions> Decode(absl::Span<uint8_t const> data);

  explicit OwnedOptions() = default;
  explicit OwnedOptions(Options const& options);

  ~OwnedOptions() = default;

  OwnedOptions(OwnedOptions const& other) : OwnedOptions(other.options_) {}

  OwnedOptions& operator=(OwnedOptions const& other) {
    if (this != &other) {
      OwnedOptions copy{other};
      swap(copy);
    }
    return *this;
  }

  OwnedOptions(OwnedOptions&&) noexcept = default;
  OwnedOptions& operator=(OwnedOptions&&) noexcept = default;

  void swap(OwnedOptions& other) noexcept {
    using std::swap;  // ensure ADL
    swap(arena_, other.arena_);
    swap(options_, other.options_);
  }

  friend void swap(OwnedOptions& lhs, OwnedOptions& rhs) noexcept { lhs.swap(rhs); }

  // The returned reference and all the views in it are valid as long as this object is alive.
  Options const& options() const { return options_; }

  Options const& operator*() const { return options_; }
  Options const* operator->() const { return &options_; }

  friend bool operator==(OwnedOptions const& lhs, OwnedOptions const& rhs) {
    return lhs.options_ == rhs.options_;
  }

  friend bool operator!=(OwnedOptions const& lhs, OwnedOptions const& rhs) {
    return lhs.options_ != rhs.options_;
  }

 private:
  explicit OwnedOptions(nanogen::io::Buffer arena, Options options)
      : arena_(std::move(arena)), options_(std::move(options)) {}

  nanogen::io::Buffer arena_;
  Options options_;
};

}  // namespace options
}  // namespace nanogen

#endif  // __NANOGEN_OPTIONS_OWNED_OPTIONS_H__
