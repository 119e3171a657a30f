#include <gtest/gtest.h>
#include "math/int256_math.hpp"
#include "common/errors.hpp"

TEST(Int256MathTest, ToSigned256AcceptsMaximum) {
  const uint256_t max = Int256Math::MaxInt256();
  EXPECT_EQ(Int256Math::ToSigned256(max).str(),
            "57896044618658097711785492504343953926634992332820282019728792003956564819967");
  EXPECT_EQ(Int256Math::ToSigned256(uint256_t(0)), 0);
}

TEST(Int256MathTest, ToSigned256RejectsSignBit) {
  const uint256_t too_big = uint256_t(1) << 255;
  EXPECT_THROW(Int256Math::ToSigned256(too_big), InvalidMagnitudeError);
  EXPECT_THROW(Int256Math::ToSigned256((std::numeric_limits<uint256_t>::max)()), InvalidMagnitudeError);
}

TEST(Int256MathTest, DivisionTruncatesTowardZero) {
  EXPECT_EQ(Int256Math::Div(int256_t(7), int256_t(2)), 3);
  EXPECT_EQ(Int256Math::Div(int256_t(-7), int256_t(2)), -3);
  EXPECT_EQ(Int256Math::Div(int256_t(7), int256_t(-2)), -3);
  EXPECT_EQ(Int256Math::Div(int256_t(-1), int256_t(10)), 0);
}

TEST(Int256MathTest, DivisionByZeroIsDomainError) {
  EXPECT_THROW(Int256Math::Div(int256_t(1), int256_t(0)), std::domain_error);
}

TEST(Int256MathTest, MinDividedByMinusOneOverflows) {
  const int256_t min = -(int256_t(1) << 255);
  EXPECT_THROW(Int256Math::Div(min, int256_t(-1)), std::overflow_error);
  EXPECT_EQ(Int256Math::Div(min, int256_t(1)), min);
}

TEST(Int256MathTest, MultiplicationPastInt256Overflows) {
  const int256_t half = int256_t(1) << 128;
  EXPECT_THROW(Int256Math::Mul(half, half), std::overflow_error);
  EXPECT_EQ(Int256Math::Mul(int256_t(1) << 127, int256_t(-2)), -(int256_t(1) << 128));
  // Exactly -2^255 is representable.
  EXPECT_NO_THROW(Int256Math::Mul(int256_t(1) << 254, int256_t(-2)));
  EXPECT_THROW(Int256Math::Mul(int256_t(1) << 254, int256_t(2)), std::overflow_error);
}

TEST(Int256MathTest, Pow10) {
  EXPECT_EQ(Int256Math::Pow10(0), 1);
  EXPECT_EQ(Int256Math::Pow10(18).str(), "1000000000000000000");
  EXPECT_NO_THROW(Int256Math::Pow10(77));
  EXPECT_THROW(Int256Math::Pow10(78), std::overflow_error);
}
