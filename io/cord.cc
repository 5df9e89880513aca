#include "io/cord.h"

#include <utility>

#include "io/buffer.h"

namespace nanogen {
namespace io {

void Cord::Append(Buffer buffer) {
  if (buffer.empty()) {
    return;
  }
  size_ += buffer.size();
  pieces_.emplace_back(std::move(buffer));
}

Buffer Cord::Flatten() && {
  switch (pieces_.size()) {
    case 0:
      return Buffer();
    case 1:
      return std::move(pieces_.front());
    default: {
      Buffer result{size_};
      for (auto const& piece : pieces_) {
        result.Append(piece);
      }
      return result;
    }
  }
}

}  // namespace io
}  // namespace nanogen
