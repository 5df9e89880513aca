#ifndef __NANOGEN_IO_BUFFER_TESTING_H__
#define __NANOGEN_IO_BUFFER_TESTING_H__

#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>

#include "absl/types/span.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "io/buffer.h"

namespace nanogen {
namespace testing {
namespace io {

// Matches a `Buffer` whose bytes match the `absl::Span<uint8_t const>` matcher `inner`.
template <typename Inner>
class BufferAsBytesMatcher : public ::testing::MatcherInterface<nanogen::io::Buffer const&> {
 public:
  using is_gtest_matcher = void;

  explicit BufferAsBytesMatcher(Inner inner) : inner_(std::move(inner)) {}

  void DescribeTo(std::ostream* const os) const override {
    *os << "is a buffer containing bytes that ";
    ::testing::SafeMatcherCast<absl::Span<uint8_t const>>(inner_).DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* const os) const override {
    *os << "is a buffer containing bytes that ";
    ::testing::SafeMatcherCast<absl::Span<uint8_t const>>(inner_).DescribeNegationTo(os);
  }

  bool MatchAndExplain(nanogen::io::Buffer const& buffer,
                       ::testing::MatchResultListener* const listener) const override {
    *listener << "contains bytes that ";
    return ::testing::SafeMatcherCast<absl::Span<uint8_t const>>(inner_).MatchAndExplain(
        buffer.span(), listener);
  }

 private:
  Inner inner_;
};

template <typename Inner>
BufferAsBytesMatcher<Inner> BufferAsBytes(Inner inner) {
  return BufferAsBytesMatcher<Inner>(std::move(inner));
}

template <typename Inner>
class BufferAsStringMatcher : public ::testing::MatcherInterface<nanogen::io::Buffer const&> {
 public:
  using is_gtest_matcher = void;

  explicit BufferAsStringMatcher(Inner inner) : inner_(std::move(inner)) {}

  void DescribeTo(std::ostream* const os) const override {
    *os << "is a buffer containing a string that ";
    ::testing::SafeMatcherCast<std::string_view>(inner_).DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* const os) const override {
    *os << "is a buffer containing a string that ";
    ::testing::SafeMatcherCast<std::string_view>(inner_).DescribeNegationTo(os);
  }

  bool MatchAndExplain(nanogen::io::Buffer const& buffer,
                       ::testing::MatchResultListener* const listener) const override {
    *listener << "is a buffer containing a string that ";
    return ::testing::SafeMatcherCast<std::string_view>(inner_).MatchAndExplain(
        std::string_view(buffer.as_char_array(), buffer.size()), listener);
  }

 private:
  Inner inner_;
};

template <typename Inner>
BufferAsStringMatcher<Inner> BufferAsString(Inner inner) {
  return BufferAsStringMatcher<Inner>(std::move(inner));
}

}  // namespace io
}  // namespace testing
}  // namespace nanogen

#endif  // __NANOGEN_IO_BUFFER_TESTING_H__
