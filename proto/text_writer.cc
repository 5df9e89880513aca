#include "proto/text_writer.h"

#include <string>

#include "absl/log/check.h"

namespace nanogen {
namespace proto {

void TextWriter::Indent() {
  if (++indentation_level_ > indentation_cords_.size()) {
    indentation_cords_.emplace_back(std::string(indentation_level_ * kIndentWidth, ' '));
  }
}

void TextWriter::Dedent() {
  CHECK_GT(indentation_level_, 0) << "unbalanced dedent";
  --indentation_level_;
}

std::string TextWriter::Finish() && { return std::string(content_.Flatten()); }

void TextWriter::AppendIndentation() {
  if (indentation_level_ > 0) {
    content_.Append(indentation_cords_[indentation_level_ - 1]);
  }
}

}  // namespace proto
}  // namespace nanogen
