#pragma once
#include <cstdint>
#include <string>
#include "oracle/round_data.hpp"

// Aggregator-compatible price feed. Primary and derived feeds implement the same
// interface so consumers never need to know which one they hold.
class PriceFeed {
public:
  virtual ~PriceFeed() = default;
  virtual uint8_t Decimals() const = 0;
  virtual std::string Description() const = 0;
  virtual uint256_t Version() const = 0;
  virtual RoundData GetRoundData(const uint80_t& round_id) const = 0;
  virtual RoundData LatestRoundData() const = 0;
};
