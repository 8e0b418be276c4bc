#include <ustar-view/constants.hxx>
#include <ustar-view/detail/numeric-field.hxx>

#include <gtest/gtest.h>

#include <span>
#include <string_view>

using ustar_view::errc;
using ustar_view::detail::parse_octal;

namespace {
/// Header fields are fixed-width, so the literal's length is the field width.
std::span<const char> field_of(std::string_view text) {
  return {text.data(), text.size()};
}
} // namespace

TEST(NumericFieldTest, AllSpacesDecodesToZero) {
  const auto value = parse_octal(field_of("        "));
  ASSERT_TRUE(value);
  EXPECT_EQ(value.value(), 0u);
}

TEST(NumericFieldTest, AllNulDecodesToZero) {
  const auto value = parse_octal(field_of(std::string_view("\0\0\0\0\0\0\0\0", 8)));
  ASSERT_TRUE(value);
  EXPECT_EQ(value.value(), 0u);
}

TEST(NumericFieldTest, NulTerminatedOctal) {
  const auto value = parse_octal(field_of(std::string_view("0000644\0", 8)));
  ASSERT_TRUE(value);
  EXPECT_EQ(value.value(), 0644u);
}

TEST(NumericFieldTest, LeadingSpacesAndSpaceTerminator) {
  const auto value = parse_octal(field_of("   1750 "));
  ASSERT_TRUE(value);
  EXPECT_EQ(value.value(), 1000u);
}

TEST(NumericFieldTest, FieldWithoutTerminatorUsesFullWidth) {
  const auto value = parse_octal(field_of("000000001001"));
  ASSERT_TRUE(value);
  EXPECT_EQ(value.value(), 513u);
}

TEST(NumericFieldTest, BytesAfterTerminatorAreIgnored) {
  const auto value = parse_octal(field_of(std::string_view("011220\0 ", 8)));
  ASSERT_TRUE(value);
  EXPECT_EQ(value.value(), 011220u);

  const auto trailing = parse_octal(field_of(std::string_view("12\0xyz99", 8)));
  ASSERT_TRUE(trailing);
  EXPECT_EQ(trailing.value(), 012u);
}

TEST(NumericFieldTest, NonOctalDigitFails) {
  const auto eight = parse_octal(field_of(std::string_view("0000648\0", 8)));
  ASSERT_FALSE(eight);
  EXPECT_EQ(eight.error(), errc::number_format);

  const auto letter = parse_octal(field_of("12a4    "));
  ASSERT_FALSE(letter);
  EXPECT_EQ(letter.error(), errc::number_format);
}

TEST(NumericFieldTest, SpaceBetweenDigitsTerminates) {
  const auto value = parse_octal(field_of("12 34   "));
  ASSERT_TRUE(value);
  EXPECT_EQ(value.value(), 012u);
}

TEST(NumericFieldTest, EntrySizeBound) {
  // 8 GiB - 1 is the largest accepted entry size.
  const auto largest = parse_octal(field_of(std::string_view("77777777777\0", 12)),
                                   ustar_view::max_entry_size);
  ASSERT_TRUE(largest);
  EXPECT_EQ(largest.value(), ustar_view::max_entry_size);

  const auto too_large = parse_octal(field_of("100000000000"),
                                     ustar_view::max_entry_size);
  ASSERT_FALSE(too_large);
  EXPECT_EQ(too_large.error(), errc::number_overflow);
}

TEST(NumericFieldTest, OverflowOfSmallBound) {
  const auto value = parse_octal(field_of("10      "), 7);
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error(), errc::number_overflow);

  const auto zero_bound = parse_octal(field_of("1       "), 0);
  ASSERT_FALSE(zero_bound);
  EXPECT_EQ(zero_bound.error(), errc::number_overflow);
}

TEST(NumericFieldTest, OverflowOfUnsigned64) {
  // 22 octal digits exceed 64 bits.
  const auto value = parse_octal(field_of("7777777777777777777777"));
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error(), errc::number_overflow);
}
