#pragma once
#include <memory>
#include <string>
#include "oracle/derived_price_feed.hpp"
#include "oracle/static_price_feed.hpp"
#include "oracle/static_rate_source.hpp"
#include "utils/json_util.hpp"

// Upstream values captured offline: the reference feed's rounds and the wrapped
// token's decimals and exchange rate, plus the derived feed's parameters.
//
// {
//   "reference_feed": {"address": "0x..", "decimals": 18, "description": "stETH / ETH",
//                      "rounds": [{"round_id": 1, "answer": "2000000000000000000000",
//                                  "started_at": 1700000000, "updated_at": 1700000000,
//                                  "answered_in_round": 1}]},
//   "wrapped_token": {"address": "0x..", "decimals": 18, "exchange_rate": "1100000000000000000"},
//   "decimals": 8,
//   "description": "Custom price feed for wstETH / ETH"
// }
struct FeedSnapshot {
  std::string reference_feed_address;
  std::shared_ptr<StaticPriceFeed> reference_feed;
  std::string wrapped_token_address;
  std::shared_ptr<StaticRateSource> wrapped_token;
  DerivedFeedParams params;
};

FeedSnapshot ParseFeedSnapshot(const Json& j);
FeedSnapshot LoadFeedSnapshot(const std::string& path);

std::unique_ptr<DerivedPriceFeed> MakeDerivedFeed(const FeedSnapshot& snapshot);

Json ToJson(const RoundData& round);
