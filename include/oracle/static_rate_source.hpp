#pragma once
#include "oracle/exchange_rate_source.hpp"

class StaticRateSource : public ExchangeRateSource {
public:
  StaticRateSource(uint8_t decimals, const uint256_t& exchange_rate)
    : decimals_(decimals), exchange_rate_(exchange_rate) {}

  uint8_t Decimals() const override { return decimals_; }
  uint256_t ExchangeRate() const override { return exchange_rate_; }

  void SetExchangeRate(const uint256_t& exchange_rate) { exchange_rate_ = exchange_rate; }

private:
  uint8_t decimals_;
  uint256_t exchange_rate_;
};
