#include "oracle/derived_price_feed.hpp"
#include "math/int256_math.hpp"
#include "utils/address.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

DerivedPriceFeed::DerivedPriceFeed(std::shared_ptr<const PriceFeed> reference_feed,
                                   std::shared_ptr<const ExchangeRateSource> wrapped_token,
                                   const DerivedFeedParams& params)
  : reference_feed_(std::move(reference_feed)), wrapped_token_(std::move(wrapped_token)) {
  if (!reference_feed_ || !wrapped_token_) throw ConfigurationError("derived feed needs a reference feed and a wrapped token");
  config_.reference_feed_address = Address::Normalize(params.reference_feed_address);
  config_.wrapped_token_address = Address::Normalize(params.wrapped_token_address);
  config_.reference_feed_decimals = reference_feed_->Decimals();
  config_.wrapped_token_scale = Int256Math::Pow10(wrapped_token_->Decimals());
  config_.decimals = params.decimals;
  config_.description = params.description;
  if (config_.decimals > config_.reference_feed_decimals) {
    throw ConfigurationError("bad decimals: feed decimals " + std::to_string(config_.decimals) +
                             " exceed reference feed decimals " + std::to_string(config_.reference_feed_decimals));
  }
  rescale_divisor_ = Int256Math::ToSigned256(Int256Math::Pow10(config_.reference_feed_decimals - config_.decimals));
  Logger::Info("Derived feed '" + config_.description + "' reference=" + config_.reference_feed_address +
               " (decimals=" + std::to_string(config_.reference_feed_decimals) + ") wrapped=" +
               config_.wrapped_token_address + " scale=" + config_.wrapped_token_scale.str() +
               " decimals=" + std::to_string(config_.decimals));
}

RoundData DerivedPriceFeed::GetRoundData(const uint80_t& round_id) const {
  return Derive(reference_feed_->GetRoundData(round_id));
}

RoundData DerivedPriceFeed::LatestRoundData() const {
  return Derive(reference_feed_->LatestRoundData());
}

RoundData DerivedPriceFeed::Derive(const RoundData& reference) const {
  const int256_t rate = Int256Math::ToSigned256(wrapped_token_->ExchangeRate());
  const int256_t scale = Int256Math::ToSigned256(config_.wrapped_token_scale);
  // Two truncating divisions; rounding error may compound and is not corrected.
  int256_t price = Int256Math::Div(Int256Math::Mul(reference.answer, scale), rate);
  price = Int256Math::Div(price, rescale_divisor_);
  RoundData out = reference;
  out.answer = price;
  return out;
}
