#pragma once
#include <cstdint>
#include "common/int_types.hpp"

// A wrapped, yield-bearing token that reports how much underlying one unit is worth.
class ExchangeRateSource {
public:
  virtual ~ExchangeRateSource() = default;
  // Precision of the wrapped token itself.
  virtual uint8_t Decimals() const = 0;
  // Underlying units per one wrapped unit, scaled by the underlying's decimals. Always live.
  virtual uint256_t ExchangeRate() const = 0;
};
