#pragma once
#include "common/int_types.hpp"

// Solidity-style int256 arithmetic on top of boost cpp_int.
// Results outside [-2^255, 2^255 - 1] raise std::overflow_error, the analogue of an
// EVM arithmetic panic. Division truncates toward zero.
namespace Int256Math {
  const uint256_t& MaxInt256();

  // Reinterprets an unsigned word as int256; InvalidMagnitudeError above 2^255 - 1.
  int256_t ToSigned256(const uint256_t& value);

  int256_t Mul(const int256_t& a, const int256_t& b);
  // std::domain_error on a zero divisor.
  int256_t Div(const int256_t& a, const int256_t& b);

  // 10^exponent; std::overflow_error past 10^77.
  uint256_t Pow10(unsigned exponent);

  bool InRange(const int512_t& value);
}
