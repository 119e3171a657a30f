#include "oracle/scaling_price_feed.hpp"
#include "math/int256_math.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

ScalingPriceFeed::ScalingPriceFeed(std::shared_ptr<const PriceFeed> underlying, uint8_t decimals)
  : underlying_(std::move(underlying)), decimals_(decimals) {
  if (!underlying_) throw ConfigurationError("scaling feed needs an underlying feed");
  if (decimals_ > kMaxDecimals) throw ConfigurationError("bad decimals: " + std::to_string(decimals_) + " > 18");
  description_ = underlying_->Description();
  const uint8_t underlying_decimals = underlying_->Decimals();
  should_upscale_ = underlying_decimals < decimals_;
  rescale_factor_ = Int256Math::ToSigned256(should_upscale_
    ? Int256Math::Pow10(decimals_ - underlying_decimals)
    : Int256Math::Pow10(underlying_decimals - decimals_));
  Logger::Info("Scaling feed '" + description_ + "' " + std::to_string(underlying_decimals) + " -> " +
               std::to_string(decimals_) + " decimals");
}

RoundData ScalingPriceFeed::GetRoundData(const uint80_t& round_id) const {
  return Scale(underlying_->GetRoundData(round_id));
}

RoundData ScalingPriceFeed::LatestRoundData() const {
  return Scale(underlying_->LatestRoundData());
}

RoundData ScalingPriceFeed::Scale(RoundData round) const {
  round.answer = should_upscale_
    ? Int256Math::Mul(round.answer, rescale_factor_)
    : Int256Math::Div(round.answer, rescale_factor_);
  return round;
}
