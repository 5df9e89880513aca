#include "options/owned_options.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "common/testing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "options/options.h"
#include "proto/decode_error.h"

namespace {

using ::absl_testing::StatusIs;
using ::nanogen::options::Options;
using ::nanogen::options::OwnedOptions;
using ::nanogen::options::UnknownField;
using ::nanogen::proto::WireType;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Optional;

std::vector<uint8_t> const kEncodedOptions{
    0x08, 0x40,                             // max_size: 64
    0x92, 0x01, 0x03, 'f', 'o', 'o',        // callback_datatype: "foo"
    0xC2, 0x01, 0x03, 'a', '.', 'h',        // include: "a.h"
    0xCA, 0x01, 0x03, 'b', 'a', 'r',        // package: "bar"
    0xD2, 0x01, 0x03, 'b', '.', 'h',        // exclude: "b.h"
    0xB2, 0x06, 0x03, 'x', 'y', 'z',        // 102: "xyz"
};

void ExpectDecodedOptions(Options const& options) {
  EXPECT_THAT(options.max_size, Optional(64));
  EXPECT_THAT(options.callback_datatype, Optional(std::string_view("foo")));
  EXPECT_FALSE(options.callback_function.has_value());
  EXPECT_THAT(options.include, ElementsAre("a.h"));
  EXPECT_THAT(options.exclude, ElementsAre("b.h"));
  EXPECT_THAT(options.package, Optional(std::string_view("bar")));
  ASSERT_EQ(options.unknown_fields.size(), 1);
  EXPECT_EQ(options.unknown_fields[0].number, 102);
  EXPECT_EQ(options.unknown_fields[0].wire_type, WireType::kLength);
  EXPECT_THAT(options.unknown_fields[0].payload, ElementsAre('x', 'y', 'z'));
}

bool PointsInto(std::string_view const value, std::vector<uint8_t> const& data) {
  auto const* const begin = reinterpret_cast<char const*>(data.data());
  return value.data() >= begin && value.data() < begin + data.size();
}

TEST(OwnedOptionsTest, Empty) {
  OwnedOptions options;
  EXPECT_EQ(options.options(), Options());
  EXPECT_THAT(options->include, IsEmpty());
}

TEST(OwnedOptionsTest, Decode) {
  auto const status_or_options = OwnedOptions::Decode(kEncodedOptions);
  ASSERT_OK(status_or_options);
  ExpectDecodedOptions(status_or_options->options());
  EXPECT_FALSE(PointsInto(*status_or_options->options().package, kEncodedOptions));
}

TEST(OwnedOptionsTest, DecodeError) {
  std::vector<uint8_t> const data{0x08, 0x80};
  EXPECT_THAT(OwnedOptions::Decode(data), StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(OwnedOptionsTest, SurvivesSourceBuffer) {
  auto data = std::make_unique<std::vector<uint8_t>>(kEncodedOptions);
  auto status_or_options = Options::Decode(*data);
  ASSERT_OK(status_or_options);
  OwnedOptions const owned{status_or_options.value()};
  EXPECT_FALSE(PointsInto(*owned->callback_datatype, *data));
  EXPECT_FALSE(PointsInto(owned->include[0], *data));
  data.reset();
  ExpectDecodedOptions(*owned);
}

TEST(OwnedOptionsTest, EmptyStringsStayPresent) {
  Options options;
  options.package = "";
  options.include = {""};
  OwnedOptions const owned{options};
  EXPECT_THAT(owned->package, Optional(std::string_view("")));
  EXPECT_THAT(owned->include, ElementsAre(""));
  EXPECT_EQ(owned.options(), options);
}

TEST(OwnedOptionsTest, Copy) {
  auto status_or_options = OwnedOptions::Decode(kEncodedOptions);
  ASSERT_OK(status_or_options);
  std::optional<OwnedOptions> original{std::move(status_or_options).value()};
  OwnedOptions const copy{*original};
  EXPECT_EQ(copy, *original);
  EXPECT_NE(copy->package->data(), (*original)->package->data());
  original.reset();
  ExpectDecodedOptions(*copy);
}

TEST(OwnedOptionsTest, CopyAssign) {
  auto status_or_options = OwnedOptions::Decode(kEncodedOptions);
  ASSERT_OK(status_or_options);
  std::optional<OwnedOptions> original{std::move(status_or_options).value()};
  OwnedOptions copy;
  copy = *original;
  EXPECT_EQ(copy, *original);
  original.reset();
  ExpectDecodedOptions(*copy);
}

TEST(OwnedOptionsTest, Move) {
  auto status_or_options = OwnedOptions::Decode(kEncodedOptions);
  ASSERT_OK(status_or_options);
  OwnedOptions original{std::move(status_or_options).value()};
  auto const* const package = original->package->data();
  OwnedOptions const moved{std::move(original)};
  EXPECT_EQ(moved->package->data(), package);
  ExpectDecodedOptions(*moved);
}

TEST(OwnedOptionsTest, MoveAssign) {
  auto status_or_options = OwnedOptions::Decode(kEncodedOptions);
  ASSERT_OK(status_or_options);
  OwnedOptions original{std::move(status_or_options).value()};
  OwnedOptions moved;
  moved = std::move(original);
  ExpectDecodedOptions(*moved);
}

TEST(OwnedOptionsTest, Swap) {
  auto status_or_options = OwnedOptions::Decode(kEncodedOptions);
  ASSERT_OK(status_or_options);
  OwnedOptions lhs{std::move(status_or_options).value()};
  OwnedOptions rhs;
  swap(lhs, rhs);
  EXPECT_EQ(lhs.options(), Options());
  ExpectDecodedOptions(*rhs);
}

TEST(OwnedOptionsTest, Compare) {
  Options options1;
  options1.package = "foo";
  Options options2;
  options2.package = "bar";
  OwnedOptions const owned1{options1};
  OwnedOptions const owned2{options1};
  OwnedOptions const owned3{options2};
  EXPECT_EQ(owned1, owned2);
  EXPECT_NE(owned1, owned3);
}

TEST(OwnedOptionsTest, UnknownPayloadsAreCopied) {
  uint8_t const payload[] = {1, 2, 3, 4};
  Options options;
  options.unknown_fields.push_back(UnknownField{
      .number = 200,
      .wire_type = WireType::kInt32,
      .payload = payload,
  });
  OwnedOptions const owned{options};
  ASSERT_EQ(owned->unknown_fields.size(), 1);
  EXPECT_NE(owned->unknown_fields[0].payload.data(), &payload[0]);
  EXPECT_THAT(owned->unknown_fields[0].payload, ElementsAre(1, 2, 3, 4));
}

}  // namespace
