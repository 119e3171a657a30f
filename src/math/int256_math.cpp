#include "math/int256_math.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace {
  const int512_t& MinInt256Wide() {
    static const int512_t v = -(int512_t(1) << 255);
    return v;
  }
  const int512_t& MaxInt256Wide() {
    static const int512_t v = (int512_t(1) << 255) - 1;
    return v;
  }

  int256_t Narrow(const int512_t& v) {
    if (!Int256Math::InRange(v)) throw std::overflow_error("arithmetic overflow: " + v.str());
    return static_cast<int256_t>(v);
  }
}

namespace Int256Math {
  const uint256_t& MaxInt256() {
    static const uint256_t v = (uint256_t(1) << 255) - 1;
    return v;
  }

  bool InRange(const int512_t& value) {
    return value >= MinInt256Wide() && value <= MaxInt256Wide();
  }

  int256_t ToSigned256(const uint256_t& value) {
    if (value > MaxInt256()) {
      throw InvalidMagnitudeError("value does not fit in int256: " + value.str());
    }
    return static_cast<int256_t>(value);
  }

  int256_t Mul(const int256_t& a, const int256_t& b) {
    return Narrow(int512_t(a) * int512_t(b));
  }

  int256_t Div(const int256_t& a, const int256_t& b) {
    if (b == 0) throw std::domain_error("division by zero");
    // MIN / -1 is the only quotient that leaves the range.
    return Narrow(int512_t(a) / int512_t(b));
  }

  uint256_t Pow10(unsigned exponent) {
    if (exponent > 77) throw std::overflow_error("10^" + std::to_string(exponent) + " exceeds uint256");
    uint256_t out = 1;
    for (unsigned i = 0; i < exponent; ++i) out *= 10;
    return out;
  }
}
