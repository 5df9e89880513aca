#ifndef __NANOGEN_PROTO_TEXT_WRITER_H__
#define __NANOGEN_PROTO_TEXT_WRITER_H__

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace nanogen {
namespace proto {

// Builds indented, line-oriented text such as text-format protobuf renderings. Each indentation
// level is two spaces wide.
class TextWriter {
 public:
  // Writes `name {` upon construction and the matching `}` upon destruction. Everything written in
  // between is indented by one level.
  class Block final {
   public:
    explicit Block(TextWriter* const parent, std::string_view const name) : parent_(parent) {
      parent_->AppendLine(name, " {");
      parent_->Indent();
    }

    ~Block() {
      parent_->Dedent();
      parent_->AppendLine("}");
    }

   private:
    Block(Block const&) = delete;
    Block& operator=(Block const&) = delete;
    Block(Block&&) = delete;
    Block& operator=(Block&&) = delete;

    TextWriter* const parent_;
  };

  explicit TextWriter() = default;

  void Indent();
  void Dedent();

  template <typename... Args>
  void AppendLine(Args&&... args) {
    AppendIndentation();
    content_.Append(absl::StrCat(std::forward<Args>(args)..., "\n"));
  }

  // Writes a `name: value` line.
  template <typename Value>
  void AppendField(std::string_view const name, Value&& value) {
    AppendLine(name, ": ", std::forward<Value>(value));
  }

  std::string Finish() &&;

 private:
  static inline size_t constexpr kIndentWidth = 2;

  void AppendIndentation();

  size_t indentation_level_ = 0;
  std::vector<absl::Cord> indentation_cords_;

  absl::Cord content_;
};

}  // namespace proto
}  // namespace nanogen

#endif  // __NANOGEN_PROTO_TEXT_WRITER_H__
