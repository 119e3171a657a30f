#pragma once
#include <memory>
#include <string>
#include "oracle/price_feed.hpp"
#include "oracle/exchange_rate_source.hpp"

struct DerivedFeedParams {
  std::string reference_feed_address;
  std::string wrapped_token_address;
  uint8_t decimals = 8;
  std::string description = "Custom price feed for wrapped token / settlement asset";
};

// Captured once at construction and never changed; a new parameter set needs a new feed.
struct DerivedFeedConfig {
  std::string reference_feed_address;
  std::string wrapped_token_address;
  uint8_t reference_feed_decimals = 0;
  uint256_t wrapped_token_scale = 1;
  uint8_t decimals = 0;
  std::string description;
};

// Prices a wrapped token in the reference feed's settlement asset:
//   answer * 10^wrapped.decimals / exchangeRate / 10^(reference.decimals - decimals)
// Round ids and timestamps are the reference feed's, unmodified. The exchange rate is
// read live on every query, including for historical rounds.
class DerivedPriceFeed : public PriceFeed {
public:
  static constexpr unsigned kVersion = 1;

  // ConfigurationError if params.decimals exceeds the reference feed's decimals or an
  // address is malformed.
  DerivedPriceFeed(std::shared_ptr<const PriceFeed> reference_feed,
                   std::shared_ptr<const ExchangeRateSource> wrapped_token,
                   const DerivedFeedParams& params);

  uint8_t Decimals() const override { return config_.decimals; }
  std::string Description() const override { return config_.description; }
  uint256_t Version() const override { return kVersion; }
  RoundData GetRoundData(const uint80_t& round_id) const override;
  RoundData LatestRoundData() const override;

  const DerivedFeedConfig& Config() const { return config_; }

private:
  RoundData Derive(const RoundData& reference) const;

  std::shared_ptr<const PriceFeed> reference_feed_;
  std::shared_ptr<const ExchangeRateSource> wrapped_token_;
  DerivedFeedConfig config_;
  int256_t rescale_divisor_ = 1;
};
