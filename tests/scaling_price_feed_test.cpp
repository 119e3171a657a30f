#include <gtest/gtest.h>
#include "oracle/scaling_price_feed.hpp"
#include "oracle/static_price_feed.hpp"
#include "common/errors.hpp"

namespace {

// Phase 1, aggregator round 1.
const uint80_t kRoundId = (uint80_t(1) << 64) | 1u;

std::shared_ptr<StaticPriceFeed> UsdFeed(uint8_t decimals, const int256_t& answer) {
  RoundData r;
  r.round_id = kRoundId;
  r.answer = answer;
  r.started_at = 1690000000;
  r.updated_at = 1690000042;
  r.answered_in_round = kRoundId;
  return std::make_shared<StaticPriceFeed>(decimals, "USDC / USD", std::vector<RoundData>{r});
}

}  // namespace

TEST(ScalingPriceFeedTest, UpscalesWhenTargetHasMoreDecimals) {
  ScalingPriceFeed feed(UsdFeed(6, int256_t(999950)), 8);
  EXPECT_TRUE(feed.ShouldUpscale());
  EXPECT_EQ(feed.RescaleFactor(), 100);
  EXPECT_EQ(feed.LatestRoundData().answer, 99995000);
}

TEST(ScalingPriceFeedTest, DownscalesAndTruncates) {
  ScalingPriceFeed feed(UsdFeed(18, int256_t(1999999999999999999LL)), 8);
  EXPECT_FALSE(feed.ShouldUpscale());
  EXPECT_EQ(feed.LatestRoundData().answer, 199999999);
}

TEST(ScalingPriceFeedTest, EqualDecimalsIsIdentity) {
  auto underlying = UsdFeed(8, int256_t(-12345));
  ScalingPriceFeed feed(underlying, 8);
  EXPECT_EQ(feed.RescaleFactor(), 1);
  EXPECT_EQ(feed.LatestRoundData(), underlying->LatestRoundData());
}

TEST(ScalingPriceFeedTest, CopiesDescriptionAndPassesRoundFieldsThrough) {
  auto underlying = UsdFeed(6, int256_t(1000000));
  ScalingPriceFeed feed(underlying, 8);
  EXPECT_EQ(feed.Description(), "USDC / USD");
  EXPECT_EQ(feed.Decimals(), 8);
  EXPECT_EQ(feed.Version(), 1);
  const RoundData scaled = feed.GetRoundData(kRoundId);
  const RoundData raw = underlying->GetRoundData(kRoundId);
  EXPECT_EQ(scaled.round_id, raw.round_id);
  EXPECT_EQ(scaled.started_at, raw.started_at);
  EXPECT_EQ(scaled.updated_at, raw.updated_at);
  EXPECT_EQ(scaled.answered_in_round, raw.answered_in_round);
}

TEST(ScalingPriceFeedTest, TargetAboveEighteenDecimalsIsRejected) {
  EXPECT_THROW(ScalingPriceFeed(UsdFeed(8, int256_t(1)), 19), ConfigurationError);
}

TEST(StaticPriceFeedTest, LatestIsHighestRound) {
  StaticPriceFeed feed(8, "ETH / USD");
  EXPECT_THROW(feed.LatestRoundData(), std::out_of_range);
  RoundData a; a.round_id = 1; a.answer = 100;
  RoundData b; b.round_id = 2; b.answer = 200;
  feed.PushRound(a);
  feed.PushRound(b);
  EXPECT_EQ(feed.LatestRoundData().answer, 200);
  EXPECT_EQ(feed.GetRoundData(1).answer, 100);
  EXPECT_THROW(feed.GetRoundData(3), std::out_of_range);
  EXPECT_THROW(feed.PushRound(a), ConfigurationError);
  EXPECT_EQ(feed.RoundCount(), 2u);
}
