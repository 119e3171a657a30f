#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "config/feed_snapshot.hpp"
#include "config/network.hpp"
#include "math/decimal.hpp"
#include <iostream>
#include <string>

static void PrintUsage() {
  std::cerr << "usage:\n"
            << "  derived_feed price [snapshot.json] [round_id]\n"
            << "  derived_feed assets [configuration.json] [contracts.json]\n"
            << "paths default to FEED_SNAPSHOT_PATH, NETWORK_CONFIG_PATH and CONTRACTS_PATH from .env" << std::endl;
}

static int RunPrice(int argc, char** argv) {
  const std::string path = argc > 2 ? argv[2] : ConfigManager::GetOrThrow("FEED_SNAPSHOT_PATH");
  FeedSnapshot snapshot = LoadFeedSnapshot(path);
  const int decimals_override = ConfigManager::GetIntOr("FEED_DECIMALS", -1);
  if (decimals_override >= 0) {
    if (decimals_override > 255) throw ConfigurationError("FEED_DECIMALS out of range: " + std::to_string(decimals_override));
    snapshot.params.decimals = static_cast<uint8_t>(decimals_override);
  }
  auto derived = MakeDerivedFeed(snapshot);
  const PriceFeed& feed = *derived;

  RoundData round;
  if (argc > 3) {
    const uint256_t id = Decimal::ParseUint256(argv[3]);
    if (id >> 80 != 0) throw ConfigurationError(std::string("round id does not fit in uint80: ") + argv[3]);
    round = feed.GetRoundData(uint80_t(id));
  } else {
    round = feed.LatestRoundData();
  }
  Logger::Info("Round " + round.round_id.str() + " derived answer " + round.answer.str());

  Json out{
    {"version", feed.Version().str()},
    {"description", feed.Description()},
    {"decimals", feed.Decimals()},
    {"round", ToJson(round)},
  };
  std::cout << out.dump(2) << std::endl;
  return 0;
}

static int RunAssets(int argc, char** argv) {
  const std::string path = argc > 2 ? argv[2] : ConfigManager::GetOrThrow("NETWORK_CONFIG_PATH");
  ContractMap contracts;
  if (argc > 3) {
    contracts = LoadContractMap(argv[3]);
  } else if (auto p = ConfigManager::Get("CONTRACTS_PATH")) {
    contracts = LoadContractMap(*p);
  }
  NetworkConfiguration cfg = LoadNetworkConfiguration(path, contracts);

  Json assets = Json::array();
  for (const auto& entry : cfg.assets) {
    const PackedAssetConfig packed = PackAssetConfig(entry.second);
    if (UnpackAssetConfig(packed) != entry.second) {
      throw std::logic_error("asset " + entry.first + " does not survive packing");
    }
    assets.push_back(Json{{"name", entry.first}, {"config", ToJson(entry.second)}, {"packed", ToJson(packed)}});
  }
  Json out{
    {"governor", cfg.governor},
    {"pauseGuardian", cfg.pause_guardian},
    {"baseToken", cfg.base_token},
    {"baseTokenPriceFeed", cfg.base_token_price_feed},
    {"assets", assets},
  };
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int main(int argc, char** argv) {
  ConfigManager::Initialize(".env");
  Logger::Initialize(ConfigManager::Get("LOG_FILE").value_or("derived_feed.log"),
                     Logger::ParseLevel(ConfigManager::Get("LOG_LEVEL").value_or("INFO")),
                     ConfigManager::GetBoolOr("LOG_TO_STDERR", false));

  const std::string command = argc > 1 ? argv[1] : "price";
  int rc = 2;
  try {
    if (command == "price") {
      rc = RunPrice(argc, argv);
    } else if (command == "assets") {
      rc = RunAssets(argc, argv);
    } else {
      PrintUsage();
    }
  } catch (const std::exception& e) {
    Logger::Error(std::string(command) + " failed: " + e.what());
    std::cerr << "error: " << e.what() << std::endl;
    rc = 1;
  }
  Logger::Shutdown();
  return rc;
}
