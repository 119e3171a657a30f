#include "config/network.hpp"
#include "math/decimal.hpp"
#include "math/int256_math.hpp"
#include "utils/address.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

using boost::multiprecision::cpp_int;

namespace {
  const std::unordered_map<std::string, std::string>& ContractRemap() {
    static const std::unordered_map<std::string, std::string> remap{
      {"USDC", "FiatTokenProxy"},
      {"WBTC.e", "BridgeToken"},
    };
    return remap;
  }

  uint8_t DecimalsOf(const Json& entry, const std::string& name) {
    const std::string context = "asset " + name;
    if (entry.contains("decimals")) {
      const uint8_t decimals = JsonUtil::Uint8Of(entry["decimals"], context + " decimals");
      if (entry.contains("scale") && ConfigValues::Number(entry["scale"]) != Int256Math::Pow10(decimals)) {
        throw ConfigurationError(context + ": scale does not match decimals");
      }
      return decimals;
    }
    uint256_t scale = ConfigValues::Number(JsonUtil::Require(entry, "scale", context));
    uint8_t decimals = 0;
    while (scale > 1 && scale % 10 == 0) {
      scale /= 10;
      ++decimals;
    }
    if (scale != 1) throw ConfigurationError(context + ": scale must be a power of ten");
    return decimals;
  }

  AssetConfig ParseAsset(const std::string& name, const Json& entry, const ContractMap& contracts) {
    const std::string context = "asset " + name;
    AssetConfig asset;
    asset.asset = entry.contains("address")
      ? ConfigValues::AddressOf(entry["address"])
      : GetContractAddress(name, contracts);
    asset.price_feed = ConfigValues::AddressOf(JsonUtil::Require(entry, "priceFeed", context));
    asset.decimals = DecimalsOf(entry, name);
    asset.borrow_collateral_factor = ConfigValues::Percentage(JsonUtil::Require(entry, "borrowCF", context));
    asset.liquidate_collateral_factor = ConfigValues::Percentage(JsonUtil::Require(entry, "liquidateCF", context));
    asset.liquidation_factor = ConfigValues::Percentage(JsonUtil::Require(entry, "liquidationFactor", context));
    const uint256_t supply_cap = ConfigValues::Number(JsonUtil::Require(entry, "supplyCap", context));
    if (supply_cap >> 128 != 0) throw ConfigurationError(context + ": supplyCap exceeds uint128");
    asset.supply_cap = static_cast<uint128_t>(supply_cap);
    ValidateAssetConfig(asset);
    return asset;
  }
}

namespace ConfigValues {
  uint64_t Percentage(const Json& value, bool check_range) {
    const std::string text = JsonUtil::NumberText(value);
    const cpp_int scaled = Decimal::ParseScaled(text, 18, Decimal::Rounding::Truncate);
    if (check_range) {
      if (scaled > cpp_int(AssetConfigConstants::FACTOR_SCALE)) {
        throw ConfigurationError("percentage greater than 100% [received=" + text + "]");
      } else if (scaled < 0) {
        throw ConfigurationError("percentage less than 0% [received=" + text + "]");
      }
    }
    if (scaled < 0 || scaled > cpp_int(UINT64_MAX)) throw ConfigurationError("percentage out of range [received=" + text + "]");
    return static_cast<uint64_t>(scaled);
  }

  uint256_t Number(const Json& value) {
    const std::string text = JsonUtil::NumberText(value);
    const cpp_int n = Decimal::ParseScaled(text, 0, Decimal::Rounding::Truncate);
    if (n < 0) throw ConfigurationError("expected non-negative number, got " + text);
    if (n >= (cpp_int(1) << 256)) throw ConfigurationError("number exceeds uint256: " + text);
    return static_cast<uint256_t>(n);
  }

  std::string AddressOf(const Json& value) {
    const std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    return Address::Normalize(text);
  }
}

ContractMap LoadContractMap(const std::string& path) {
  const Json j = JsonUtil::ParseFile(path);
  if (!j.is_object()) throw ConfigurationError(path + ": expected an object of name -> address");
  ContractMap contracts;
  for (auto it = j.begin(); it != j.end(); ++it) {
    contracts[it.key()] = ConfigValues::AddressOf(it.value());
  }
  Logger::Info("Loaded " + std::to_string(contracts.size()) + " contract addresses from " + path);
  return contracts;
}

std::string GetContractAddress(const std::string& name, const ContractMap& contracts) {
  auto it = contracts.find(name);
  if (it != contracts.end()) return Address::Normalize(it->second);
  auto remap = ContractRemap().find(name);
  if (remap != ContractRemap().end()) return GetContractAddress(remap->second, contracts);

  std::string known;
  for (const auto& kv : contracts) {
    if (!known.empty()) known += ", ";
    known += kv.first;
  }
  throw ConfigurationError("Cannot find contract `" + name + "` in contract map with keys `" + known + "`");
}

NetworkConfiguration ParseNetworkConfiguration(const Json& j, const ContractMap& contracts) {
  const std::string context = "network configuration";
  NetworkConfiguration cfg;
  cfg.governor = ConfigValues::AddressOf(JsonUtil::Require(j, "governor", context));
  cfg.pause_guardian = ConfigValues::AddressOf(JsonUtil::Require(j, "pauseGuardian", context));
  cfg.base_token = GetContractAddress(JsonUtil::StringOf(JsonUtil::Require(j, "baseToken", context), "baseToken"), contracts);
  cfg.base_token_price_feed = ConfigValues::AddressOf(JsonUtil::Require(j, "baseTokenPriceFeed", context));
  cfg.reserve_rate = ConfigValues::Percentage(JsonUtil::Require(j, "reserveRate", context));
  cfg.base_borrow_min = ConfigValues::Number(JsonUtil::Require(j, "borrowMin", context));
  cfg.target_reserves = ConfigValues::Number(JsonUtil::Require(j, "targetReserves", context));

  const Json& rates = JsonUtil::Require(j, "rates", context);
  cfg.rates.kink = ConfigValues::Percentage(JsonUtil::Require(rates, "kink", "rates"));
  cfg.rates.per_year_interest_rate_slope_low = ConfigValues::Percentage(JsonUtil::Require(rates, "slopeLow", "rates"));
  cfg.rates.per_year_interest_rate_slope_high = ConfigValues::Percentage(JsonUtil::Require(rates, "slopeHigh", "rates"));
  cfg.rates.per_year_interest_rate_base = ConfigValues::Percentage(JsonUtil::Require(rates, "base", "rates"));

  const Json& tracking = JsonUtil::Require(j, "tracking", context);
  cfg.tracking.tracking_index_scale = ConfigValues::Number(JsonUtil::Require(tracking, "indexScale", "tracking"));
  cfg.tracking.base_tracking_supply_speed = ConfigValues::Number(JsonUtil::Require(tracking, "baseSupplySpeed", "tracking"));
  cfg.tracking.base_tracking_borrow_speed = ConfigValues::Number(JsonUtil::Require(tracking, "baseBorrowSpeed", "tracking"));
  cfg.tracking.base_min_for_rewards = ConfigValues::Number(JsonUtil::Require(tracking, "baseMinForRewards", "tracking"));

  const Json& assets = JsonUtil::Require(j, "assets", context);
  if (!assets.is_object()) throw ConfigurationError(context + ": `assets` must be an object");
  for (auto it = assets.begin(); it != assets.end(); ++it) {
    cfg.assets.emplace_back(it.key(), ParseAsset(it.key(), it.value(), contracts));
  }
  return cfg;
}

NetworkConfiguration LoadNetworkConfiguration(const std::string& path, const ContractMap& contracts) {
  NetworkConfiguration cfg = ParseNetworkConfiguration(JsonUtil::ParseFile(path), contracts);
  Logger::Info("Loaded network configuration " + path + " with " + std::to_string(cfg.assets.size()) + " assets");
  return cfg;
}

Json ToJson(const AssetConfig& config) {
  return Json{
    {"asset", config.asset},
    {"priceFeed", config.price_feed},
    {"decimals", config.decimals},
    {"borrowCollateralFactor", std::to_string(config.borrow_collateral_factor)},
    {"liquidateCollateralFactor", std::to_string(config.liquidate_collateral_factor)},
    {"liquidationFactor", std::to_string(config.liquidation_factor)},
    {"supplyCap", config.supply_cap.str()},
  };
}

Json ToJson(const PackedAssetConfig& packed) {
  return Json{
    {"word_a", Decimal::ToHexWord(packed.word_a)},
    {"word_b", Decimal::ToHexWord(packed.word_b)},
  };
}
