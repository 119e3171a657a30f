#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "config/asset_config.hpp"
#include "utils/json_util.hpp"

// Deployed contract name -> address.
using ContractMap = std::unordered_map<std::string, std::string>;

struct InterestRateInfo {
  uint64_t kink = 0;
  uint64_t per_year_interest_rate_slope_low = 0;
  uint64_t per_year_interest_rate_slope_high = 0;
  uint64_t per_year_interest_rate_base = 0;
};

struct TrackingInfo {
  uint256_t tracking_index_scale = 0;
  uint256_t base_tracking_supply_speed = 0;
  uint256_t base_tracking_borrow_speed = 0;
  uint256_t base_min_for_rewards = 0;
};

// A market's deployment configuration (deployments/<network>/configuration.json).
struct NetworkConfiguration {
  std::string governor;
  std::string pause_guardian;
  std::string base_token;
  std::string base_token_price_feed;
  uint64_t reserve_rate = 0;
  uint256_t base_borrow_min = 0;
  uint256_t target_reserves = 0;
  InterestRateInfo rates;
  TrackingInfo tracking;
  // Declaration order of the file.
  std::vector<std::pair<std::string, AssetConfig>> assets;
};

namespace ConfigValues {
  // Fraction -> FACTOR_SCALE fixed point, floored. ConfigurationError outside [0, 1] when check_range.
  uint64_t Percentage(const Json& value, bool check_range = true);
  // Non-negative integer, floored.
  uint256_t Number(const Json& value);
  std::string AddressOf(const Json& value);
}

ContractMap LoadContractMap(const std::string& path);
// Resolves a contract name, falling back to the proxy names some tokens are deployed under.
std::string GetContractAddress(const std::string& name, const ContractMap& contracts);

NetworkConfiguration ParseNetworkConfiguration(const Json& j, const ContractMap& contracts);
NetworkConfiguration LoadNetworkConfiguration(const std::string& path, const ContractMap& contracts);

Json ToJson(const AssetConfig& config);
Json ToJson(const PackedAssetConfig& packed);
