#include "config/asset_config.hpp"
#include "math/int256_math.hpp"
#include "utils/address.hpp"
#include "common/errors.hpp"

using namespace AssetConfigConstants;

namespace {
  const uint256_t kMask16 = 0xFFFF;
  const uint256_t kMask8 = 0xFF;
  const uint256_t kMask64 = uint256_t(0xFFFFFFFFFFFFFFFFULL);
  const uint256_t kMask160 = (uint256_t(1) << 160) - 1;

  void ValidateFactor(const std::string& name, uint64_t factor) {
    if (factor > FACTOR_SCALE) {
      throw ConfigurationError(name + " greater than 100% [received=" + std::to_string(factor) + "]");
    }
    if (factor % FACTOR_DESCALE != 0) {
      throw ConfigurationError(name + " has more than 4 decimals [received=" + std::to_string(factor) + "]");
    }
  }
}

bool operator==(const AssetConfig& a, const AssetConfig& b) {
  return Address::Equal(a.asset, b.asset) && Address::Equal(a.price_feed, b.price_feed) &&
         a.decimals == b.decimals && a.borrow_collateral_factor == b.borrow_collateral_factor &&
         a.liquidate_collateral_factor == b.liquidate_collateral_factor &&
         a.liquidation_factor == b.liquidation_factor && a.supply_cap == b.supply_cap;
}

void ValidateAssetConfig(const AssetConfig& config) {
  if (!Address::IsValid(config.asset)) throw ConfigurationError("expected asset address, got `" + config.asset + "`");
  if (!Address::IsValid(config.price_feed)) throw ConfigurationError("expected price feed address, got `" + config.price_feed + "`");
  ValidateFactor("borrowCollateralFactor", config.borrow_collateral_factor);
  ValidateFactor("liquidateCollateralFactor", config.liquidate_collateral_factor);
  ValidateFactor("liquidationFactor", config.liquidation_factor);

  // 10^decimals can exceed 256 bits; such an asset can only have a zero cap.
  if (config.decimals > 77) {
    if (config.supply_cap != 0) throw ConfigurationError("supplyCap must be zero for " + std::to_string(config.decimals) + " decimals");
    return;
  }
  const uint256_t scale = Int256Math::Pow10(config.decimals);
  const uint256_t cap(config.supply_cap);
  if (cap % scale != 0) {
    throw ConfigurationError("supplyCap " + config.supply_cap.str() + " is not a whole number of units");
  }
  if (cap / scale > kMask64) {
    throw ConfigurationError("supplyCap " + config.supply_cap.str() + " exceeds 2^64-1 whole units");
  }
}

PackedAssetConfig PackAssetConfig(const AssetConfig& config) {
  ValidateAssetConfig(config);
  const uint256_t whole_units = config.decimals > 77 ? uint256_t(0) : uint256_t(config.supply_cap) / Int256Math::Pow10(config.decimals);

  PackedAssetConfig packed;
  packed.word_a = Address::ToWord(config.asset) |
                  uint256_t(config.borrow_collateral_factor / FACTOR_DESCALE) << BORROW_CF_OFFSET |
                  uint256_t(config.liquidate_collateral_factor / FACTOR_DESCALE) << LIQUIDATE_CF_OFFSET |
                  uint256_t(config.liquidation_factor / FACTOR_DESCALE) << LIQUIDATION_FACTOR_OFFSET;
  packed.word_b = Address::ToWord(config.price_feed) |
                  uint256_t(config.decimals) << DECIMALS_OFFSET |
                  whole_units << SUPPLY_CAP_OFFSET;
  return packed;
}

AssetConfig UnpackAssetConfig(const PackedAssetConfig& packed) {
  AssetConfig config;
  config.asset = Address::FromWord(packed.word_a & kMask160);
  config.borrow_collateral_factor = static_cast<uint64_t>((packed.word_a >> BORROW_CF_OFFSET) & kMask16) * FACTOR_DESCALE;
  config.liquidate_collateral_factor = static_cast<uint64_t>((packed.word_a >> LIQUIDATE_CF_OFFSET) & kMask16) * FACTOR_DESCALE;
  config.liquidation_factor = static_cast<uint64_t>((packed.word_a >> LIQUIDATION_FACTOR_OFFSET) & kMask16) * FACTOR_DESCALE;

  config.price_feed = Address::FromWord(packed.word_b & kMask160);
  config.decimals = static_cast<uint8_t>(static_cast<unsigned>((packed.word_b >> DECIMALS_OFFSET) & kMask8));
  const uint256_t whole_units = (packed.word_b >> SUPPLY_CAP_OFFSET) & kMask64;
  if (config.decimals <= 77) {
    const uint512_t cap = uint512_t(whole_units) * uint512_t(Int256Math::Pow10(config.decimals));
    if (cap >> 128 != 0) throw ConfigurationError("packed supplyCap overflows 128 bits");
    config.supply_cap = static_cast<uint128_t>(cap);
  }
  return config;
}
