#include <gtest/gtest.h>
#include "config/network.hpp"
#include "common/errors.hpp"

namespace {

const char* kConfiguration = R"({
  "governor": "0x6d903f6003cca6255d85cca4d3b5e5146dc33925",
  "pauseGuardian": "0xbbf3f1421d886e9b2c5d716b5192ac998af2012c",
  "baseToken": "USDC",
  "baseTokenPriceFeed": "0x8fffffd4afb6115b954bd326cbe7b4ba576818f6",
  "reserveRate": 0.15,
  "borrowMin": 100e6,
  "targetReserves": 5000000e6,
  "rates": { "kink": 0.8, "slopeLow": 0.04, "slopeHigh": 1.0, "base": 0.0 },
  "tracking": { "indexScale": 1e15, "baseSupplySpeed": 0, "baseBorrowSpeed": 0, "baseMinForRewards": 1000000e6 },
  "assets": {
    "WETH": {
      "priceFeed": "0x5f4ec3df9cbd43714fe2740f5e3616155c5b8419",
      "decimals": 18,
      "borrowCF": 0.825,
      "liquidateCF": 0.895,
      "liquidationFactor": 0.95,
      "supplyCap": 350000e18
    },
    "COMP": {
      "address": "0xc00e94cb662c3520282e6f5717214004a7f26888",
      "priceFeed": "0xdbd020caef83efd542f4de03e3cf0c28a4428bd5",
      "scale": 1e18,
      "borrowCF": "0.65",
      "liquidateCF": "0.70",
      "liquidationFactor": "0.88",
      "supplyCap": "200000000000000000000000"
    }
  }
})";

ContractMap Contracts() {
  return ContractMap{
    {"FiatTokenProxy", "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"},
    {"WETH", "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2"},
  };
}

}  // namespace

TEST(NetworkConfigTest, ParsesMarketConfiguration) {
  const NetworkConfiguration cfg = ParseNetworkConfiguration(Json::parse(kConfiguration), Contracts());

  EXPECT_EQ(cfg.base_token, "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
  EXPECT_EQ(cfg.reserve_rate, 150000000000000000ULL);
  EXPECT_EQ(cfg.base_borrow_min, 100000000);
  EXPECT_EQ(cfg.target_reserves, 5000000000000ULL);
  EXPECT_EQ(cfg.rates.kink, 800000000000000000ULL);
  EXPECT_EQ(cfg.rates.per_year_interest_rate_slope_high, 1000000000000000000ULL);
  EXPECT_EQ(cfg.tracking.tracking_index_scale, 1000000000000000ULL);

  ASSERT_EQ(cfg.assets.size(), 2u);
  EXPECT_EQ(cfg.assets[0].first, "WETH");
  const AssetConfig& weth = cfg.assets[0].second;
  EXPECT_EQ(weth.asset, "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
  EXPECT_EQ(weth.decimals, 18);
  EXPECT_EQ(weth.borrow_collateral_factor, 825000000000000000ULL);
  EXPECT_EQ(weth.liquidate_collateral_factor, 895000000000000000ULL);
  EXPECT_EQ(weth.liquidation_factor, 950000000000000000ULL);
  EXPECT_EQ(weth.supply_cap.str(), "350000000000000000000000");

  const AssetConfig& comp = cfg.assets[1].second;
  EXPECT_EQ(cfg.assets[1].first, "COMP");
  EXPECT_EQ(comp.asset, "0xc00e94cb662c3520282e6f5717214004a7f26888");
  EXPECT_EQ(comp.decimals, 18);
  EXPECT_EQ(comp.liquidate_collateral_factor, 700000000000000000ULL);

  for (const auto& entry : cfg.assets) {
    EXPECT_EQ(UnpackAssetConfig(PackAssetConfig(entry.second)), entry.second) << entry.first;
  }
}

TEST(NetworkConfigTest, PercentageRange) {
  EXPECT_EQ(ConfigValues::Percentage(Json(1.0)), 1000000000000000000ULL);
  EXPECT_EQ(ConfigValues::Percentage(Json(0)), 0u);
  EXPECT_THROW(ConfigValues::Percentage(Json(1.01)), ConfigurationError);
  EXPECT_THROW(ConfigValues::Percentage(Json(-0.01)), ConfigurationError);
  EXPECT_EQ(ConfigValues::Percentage(Json(3.0), false), 3000000000000000000ULL);
}

TEST(NetworkConfigTest, NumberFloors) {
  EXPECT_EQ(ConfigValues::Number(Json(12.9)), 12);
  EXPECT_EQ(ConfigValues::Number(Json("1e15")), 1000000000000000ULL);
  EXPECT_THROW(ConfigValues::Number(Json(-1)), ConfigurationError);
}

TEST(NetworkConfigTest, ContractNamesResolveThroughRemap) {
  const ContractMap contracts = Contracts();
  EXPECT_EQ(GetContractAddress("USDC", contracts), "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
  EXPECT_THROW(GetContractAddress("WBTC.e", contracts), ConfigurationError);
  EXPECT_THROW(GetContractAddress("LINK", contracts), ConfigurationError);
}

TEST(NetworkConfigTest, RejectsOutOfRangeAssetFactor) {
  Json j = Json::parse(kConfiguration);
  j["assets"]["COMP"]["liquidationFactor"] = 1.5;
  EXPECT_THROW(ParseNetworkConfiguration(j, Contracts()), ConfigurationError);
}

TEST(NetworkConfigTest, RejectsMalformedPriceFeed) {
  Json j = Json::parse(kConfiguration);
  j["assets"]["COMP"]["priceFeed"] = "0xdbd020";
  EXPECT_THROW(ParseNetworkConfiguration(j, Contracts()), ConfigurationError);
}

TEST(NetworkConfigTest, RejectsScaleThatIsNotPowerOfTen) {
  Json j = Json::parse(kConfiguration);
  j["assets"]["COMP"]["scale"] = 2500;
  EXPECT_THROW(ParseNetworkConfiguration(j, Contracts()), ConfigurationError);
}
