#pragma once
#include <cstdint>
#include <string>
#include "common/int_types.hpp"

// Collateral factors are fractions of FACTOR_SCALE (1e18 == 100%).
namespace AssetConfigConstants {
  inline constexpr uint64_t FACTOR_SCALE = 1000000000000000000ULL;
  // Packed factors keep 4 decimals.
  inline constexpr uint64_t FACTOR_DESCALE = FACTOR_SCALE / 10000ULL;
  inline constexpr unsigned MAX_ASSET_DECIMALS = 255;
  // word_a
  inline constexpr unsigned BORROW_CF_OFFSET = 160;
  inline constexpr unsigned LIQUIDATE_CF_OFFSET = 176;
  inline constexpr unsigned LIQUIDATION_FACTOR_OFFSET = 192;
  // word_b
  inline constexpr unsigned DECIMALS_OFFSET = 160;
  inline constexpr unsigned SUPPLY_CAP_OFFSET = 168;
}

// Tooling-facing form of a collateral asset registration.
struct AssetConfig {
  std::string asset;
  std::string price_feed;
  uint8_t decimals = 0;
  uint64_t borrow_collateral_factor = 0;
  uint64_t liquidate_collateral_factor = 0;
  uint64_t liquidation_factor = 0;
  // In asset base units.
  uint128_t supply_cap = 0;
};

// Addresses compare case-insensitively.
bool operator==(const AssetConfig& a, const AssetConfig& b);
inline bool operator!=(const AssetConfig& a, const AssetConfig& b) { return !(a == b); }

// Storage form: exactly two words.
//   word_a: asset(160) | borrowCF(16) | liquidateCF(16) | liquidationFactor(16)
//   word_b: priceFeed(160) | decimals(8) | supplyCap in whole units(64)
struct PackedAssetConfig {
  uint256_t word_a = 0;
  uint256_t word_b = 0;
};

inline bool operator==(const PackedAssetConfig& a, const PackedAssetConfig& b) {
  return a.word_a == b.word_a && a.word_b == b.word_b;
}

// ConfigurationError for malformed addresses, factors outside [0, FACTOR_SCALE] or finer
// than FACTOR_DESCALE, and supply caps that are not whole units or overflow 64 bits.
void ValidateAssetConfig(const AssetConfig& config);

PackedAssetConfig PackAssetConfig(const AssetConfig& config);
AssetConfig UnpackAssetConfig(const PackedAssetConfig& packed);
