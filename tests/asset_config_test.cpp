#include <gtest/gtest.h>
#include "config/asset_config.hpp"
#include "math/int256_math.hpp"
#include "common/errors.hpp"

using namespace AssetConfigConstants;

namespace {

AssetConfig Gold() {
  AssetConfig c;
  c.asset = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
  c.price_feed = "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359";
  c.decimals = 8;
  c.borrow_collateral_factor = FACTOR_SCALE;
  c.liquidate_collateral_factor = FACTOR_SCALE;
  c.liquidation_factor = 950000000000000000ULL;
  c.supply_cap = uint128_t(1000000) * 100000000u;
  return c;
}

AssetConfig Silver() {
  AssetConfig c;
  c.asset = "0xdbf03b407c01e7cd3cbea99509d93f8dddc8c6fb";
  c.price_feed = "0xd1220a0cf47c7b9be7a2e6ba89f429762e7b9adb";
  c.decimals = 10;
  c.borrow_collateral_factor = 500000000000000000ULL;
  c.liquidate_collateral_factor = 500000000000000000ULL;
  c.liquidation_factor = 900000000000000000ULL;
  c.supply_cap = uint128_t(500000) * 10000000000ULL;
  return c;
}

}  // namespace

TEST(AssetConfigTest, RoundTrips) {
  for (const AssetConfig& c : {Gold(), Silver()}) {
    EXPECT_EQ(UnpackAssetConfig(PackAssetConfig(c)), c);
  }
}

TEST(AssetConfigTest, RoundTripsAtFieldLimits) {
  AssetConfig c = Gold();
  c.asset = "0xffffffffffffffffffffffffffffffffffffffff";
  c.price_feed = "0x0000000000000000000000000000000000000001";
  c.decimals = 0;
  c.borrow_collateral_factor = 0;
  c.liquidate_collateral_factor = FACTOR_DESCALE;
  c.liquidation_factor = FACTOR_SCALE;
  c.supply_cap = uint128_t(0xFFFFFFFFFFFFFFFFULL);
  EXPECT_EQ(UnpackAssetConfig(PackAssetConfig(c)), c);

  c.decimals = 255;
  c.supply_cap = 0;
  EXPECT_EQ(UnpackAssetConfig(PackAssetConfig(c)), c);
}

TEST(AssetConfigTest, BitLayout) {
  const PackedAssetConfig p = PackAssetConfig(Gold());
  const uint256_t mask160 = (uint256_t(1) << 160) - 1;
  EXPECT_EQ(uint256_t(p.word_a & mask160), uint256_t("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
  EXPECT_EQ(uint256_t((p.word_a >> BORROW_CF_OFFSET) & 0xFFFF), 10000);
  EXPECT_EQ(uint256_t((p.word_a >> LIQUIDATE_CF_OFFSET) & 0xFFFF), 10000);
  EXPECT_EQ(uint256_t((p.word_a >> LIQUIDATION_FACTOR_OFFSET) & 0xFFFF), 9500);
  EXPECT_EQ(uint256_t(p.word_a >> 208), 0);
  EXPECT_EQ(uint256_t(p.word_b & mask160), uint256_t("0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359"));
  EXPECT_EQ(uint256_t((p.word_b >> DECIMALS_OFFSET) & 0xFF), 8);
  EXPECT_EQ(uint256_t(p.word_b >> SUPPLY_CAP_OFFSET), 1000000);
}

TEST(AssetConfigTest, UnpackedAddressesAreLowercase) {
  const AssetConfig out = UnpackAssetConfig(PackAssetConfig(Gold()));
  EXPECT_EQ(out.asset, "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
}

TEST(AssetConfigTest, FactorAboveOneIsRejected) {
  AssetConfig c = Gold();
  c.liquidation_factor = FACTOR_SCALE + FACTOR_DESCALE;
  EXPECT_THROW(PackAssetConfig(c), ConfigurationError);
}

TEST(AssetConfigTest, FactorFinerThanFourDecimalsIsRejected) {
  AssetConfig c = Gold();
  c.borrow_collateral_factor = 123456789012345678ULL;
  EXPECT_THROW(ValidateAssetConfig(c), ConfigurationError);
}

TEST(AssetConfigTest, MalformedAddressIsRejected) {
  AssetConfig c = Gold();
  c.price_feed = "0x1234";
  EXPECT_THROW(PackAssetConfig(c), ConfigurationError);
  c = Gold();
  c.asset = "0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
  EXPECT_THROW(PackAssetConfig(c), ConfigurationError);
}

TEST(AssetConfigTest, SupplyCapMustBeWholeUnits) {
  AssetConfig c = Gold();
  c.supply_cap += 1;
  EXPECT_THROW(PackAssetConfig(c), ConfigurationError);
}

TEST(AssetConfigTest, SupplyCapMustFitSixtyFourBitsOfUnits) {
  AssetConfig c = Gold();
  c.decimals = 0;
  c.supply_cap = uint128_t(1) << 64;
  EXPECT_THROW(PackAssetConfig(c), ConfigurationError);
}
