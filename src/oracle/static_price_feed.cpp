#include "oracle/static_price_feed.hpp"
#include "common/errors.hpp"
#include <stdexcept>

StaticPriceFeed::StaticPriceFeed(uint8_t decimals, std::string description, const std::vector<RoundData>& rounds)
  : decimals_(decimals), description_(std::move(description)) {
  for (const auto& r : rounds) PushRound(r);
}

RoundData StaticPriceFeed::GetRoundData(const uint80_t& round_id) const {
  auto it = rounds_.find(round_id);
  if (it == rounds_.end()) throw std::out_of_range("No data present for round " + round_id.str());
  return it->second;
}

RoundData StaticPriceFeed::LatestRoundData() const {
  if (rounds_.empty()) throw std::out_of_range("No data present");
  return rounds_.rbegin()->second;
}

void StaticPriceFeed::PushRound(const RoundData& round) {
  if (!rounds_.empty() && round.round_id <= rounds_.rbegin()->first) {
    throw ConfigurationError("round " + round.round_id.str() + " is not after round " + rounds_.rbegin()->first.str());
  }
  rounds_.emplace(round.round_id, round);
}
