#pragma once
#include <string>
#include "common/int_types.hpp"

namespace Decimal {
  enum class Rounding { Exact, Truncate };

  // Parses "[-+]digits[.digits][e[-+]digits]" and returns value * 10^scale as an
  // exact integer. With Rounding::Exact any non-zero digit below 10^-scale is a
  // ConfigurationError; Truncate drops it (toward zero).
  boost::multiprecision::cpp_int ParseScaled(const std::string& text, unsigned scale,
                                             Rounding rounding = Rounding::Exact);

  // Decimal or 0x-hex unsigned integer; ConfigurationError if malformed or > 2^256 - 1.
  uint256_t ParseUint256(const std::string& text);
  // Decimal (optionally signed) or 0x-hex; ConfigurationError outside int256 bounds.
  int256_t ParseInt256(const std::string& text);

  // 0x followed by exactly 64 lowercase hex digits.
  std::string ToHexWord(const uint256_t& word);
}
