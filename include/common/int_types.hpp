#pragma once
#include <boost/multiprecision/cpp_int.hpp>

// EVM-width integers. int256_t/int512_t are boost's signed-magnitude types, so
// Solidity's two's-complement bounds are enforced separately (see math/int256_math.hpp).
using boost::multiprecision::uint128_t;
using boost::multiprecision::uint256_t;
using boost::multiprecision::int256_t;
using boost::multiprecision::int512_t;
using boost::multiprecision::uint512_t;

// Round ids are uint80 on-chain; checked so an oversized id throws std::overflow_error.
using uint80_t = boost::multiprecision::number<
  boost::multiprecision::cpp_int_backend<80, 80,
    boost::multiprecision::unsigned_magnitude,
    boost::multiprecision::checked, void>>;
