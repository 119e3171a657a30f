#pragma once
#include <memory>
#include "oracle/price_feed.hpp"

// Re-exposes a primary feed at a different precision, scaling up or down.
class ScalingPriceFeed : public PriceFeed {
public:
  static constexpr unsigned kVersion = 1;
  static constexpr uint8_t kMaxDecimals = 18;

  ScalingPriceFeed(std::shared_ptr<const PriceFeed> underlying, uint8_t decimals);

  uint8_t Decimals() const override { return decimals_; }
  std::string Description() const override { return description_; }
  uint256_t Version() const override { return kVersion; }
  RoundData GetRoundData(const uint80_t& round_id) const override;
  RoundData LatestRoundData() const override;

  bool ShouldUpscale() const { return should_upscale_; }
  const int256_t& RescaleFactor() const { return rescale_factor_; }

private:
  RoundData Scale(RoundData round) const;

  std::shared_ptr<const PriceFeed> underlying_;
  uint8_t decimals_;
  std::string description_;
  bool should_upscale_ = false;
  int256_t rescale_factor_ = 1;
};
