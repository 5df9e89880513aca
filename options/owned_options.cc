#include "options/owned_options.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "io/buffer.h"
#include "options/options.h"

namespace nanogen {
namespace options {

namespace {

size_t GetArenaSize(Options const& options) {
  size_t size = 0;
  for (auto const& field : {options.callback_datatype, options.callback_function,
                            options.package}) {
    if (field.has_value()) {
      size += field->size();
    }
  }
  for (auto const value : options.include) {
    size += value.size();
  }
  for (auto const value : options.exclude) {
    size += value.size();
  }
  for (auto const& unknown : options.unknown_fields) {
    size += unknown.payload.size();
  }
  return size;
}

absl::Span<uint8_t const> CopyToArena(nanogen::io::Buffer* const arena,
                                      absl::Span<uint8_t const> const bytes) {
  uint8_t const* const data = arena->as_byte_array() + arena->size();
  arena->MemCpy(bytes.data(), bytes.size());
  return absl::Span<uint8_t const>(data, bytes.size());
}

std::string_view CopyToArena(nanogen::io::Buffer* const arena, std::string_view const value) {
  char const* const data = arena->as_char_array() + arena->size();
  arena->MemCpy(value.data(), value.size());
  return std::string_view(data, value.size());
}

void CopyToArena(nanogen::io::Buffer* const arena, std::optional<std::string_view>* const field) {
  if (field->has_value()) {
    *field = CopyToArena(arena, field->value());
  }
}

void CopyToArena(nanogen::io::Buffer* const arena, std::vector<std::string_view>* const field) {
  for (auto& value : *field) {
    value = CopyToArena(arena, value);
  }
}

}  // namespace

absl::StatusOr<OwnedOptions> OwnedOptions::Decode(absl::Span<uint8_t const> const data) {
  nanogen::io::Buffer arena{data};
  DEFINE_VAR_OR_RETURN(options, Options::Decode(arena.span()));
  return OwnedOptions(std::move(arena), std::move(options));
}

OwnedOptions::OwnedOptions(Options const& options)
    : arena_(GetArenaSize(options)), options_(options) {
  CopyToArena(&arena_, &options_.callback_datatype);
  CopyToArena(&arena_, &options_.callback_function);
  CopyToArena(&arena_, &options_.include);
  CopyToArena(&arena_, &options_.exclude);
  CopyToArena(&arena_, &options_.package);
  for (auto& unknown : options_.unknown_fields) {
    unknown.payload = CopyToArena(&arena_, unknown.payload);
  }
}

}  // namespace options
}  // namespace nanogen
