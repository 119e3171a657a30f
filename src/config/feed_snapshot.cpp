#include "config/feed_snapshot.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace {
  uint80_t RoundIdOf(const Json& value) {
    const uint256_t id = JsonUtil::Uint256Of(value);
    if (id >> 80 != 0) throw ConfigurationError("round id " + id.str() + " does not fit in uint80");
    return uint80_t(id);
  }

  RoundData ParseRound(const Json& j) {
    RoundData round;
    round.round_id = RoundIdOf(JsonUtil::Require(j, "round_id", "round"));
    round.answer = JsonUtil::Int256Of(JsonUtil::Require(j, "answer", "round"));
    round.started_at = JsonUtil::Uint256Of(JsonUtil::Require(j, "started_at", "round"));
    round.updated_at = JsonUtil::Uint256Of(JsonUtil::Require(j, "updated_at", "round"));
    round.answered_in_round = j.contains("answered_in_round") ? RoundIdOf(j["answered_in_round"]) : round.round_id;
    return round;
  }
}

FeedSnapshot ParseFeedSnapshot(const Json& j) {
  FeedSnapshot snapshot;

  const Json& ref = JsonUtil::Require(j, "reference_feed", "snapshot");
  snapshot.reference_feed_address = JsonUtil::StringOf(JsonUtil::Require(ref, "address", "reference_feed"), "reference_feed address");
  const uint8_t ref_decimals = JsonUtil::Uint8Of(JsonUtil::Require(ref, "decimals", "reference_feed"), "reference_feed decimals");
  const std::string ref_description = ref.contains("description") ? JsonUtil::StringOf(ref["description"], "reference_feed description") : "";
  snapshot.reference_feed = std::make_shared<StaticPriceFeed>(ref_decimals, ref_description);
  const Json& rounds = JsonUtil::Require(ref, "rounds", "reference_feed");
  if (!rounds.is_array()) throw ConfigurationError("reference_feed: `rounds` must be an array");
  for (const auto& r : rounds) snapshot.reference_feed->PushRound(ParseRound(r));

  const Json& wrapped = JsonUtil::Require(j, "wrapped_token", "snapshot");
  snapshot.wrapped_token_address = JsonUtil::StringOf(JsonUtil::Require(wrapped, "address", "wrapped_token"), "wrapped_token address");
  snapshot.wrapped_token = std::make_shared<StaticRateSource>(
    JsonUtil::Uint8Of(JsonUtil::Require(wrapped, "decimals", "wrapped_token"), "wrapped_token decimals"),
    JsonUtil::Uint256Of(JsonUtil::Require(wrapped, "exchange_rate", "wrapped_token")));

  snapshot.params.reference_feed_address = snapshot.reference_feed_address;
  snapshot.params.wrapped_token_address = snapshot.wrapped_token_address;
  snapshot.params.decimals = JsonUtil::Uint8Of(JsonUtil::Require(j, "decimals", "snapshot"), "decimals");
  if (j.contains("description")) snapshot.params.description = JsonUtil::StringOf(j["description"], "description");
  return snapshot;
}

FeedSnapshot LoadFeedSnapshot(const std::string& path) {
  FeedSnapshot snapshot = ParseFeedSnapshot(JsonUtil::ParseFile(path));
  Logger::Debug("Loaded snapshot " + path + " with " + std::to_string(snapshot.reference_feed->RoundCount()) + " rounds");
  return snapshot;
}

std::unique_ptr<DerivedPriceFeed> MakeDerivedFeed(const FeedSnapshot& snapshot) {
  return std::make_unique<DerivedPriceFeed>(snapshot.reference_feed, snapshot.wrapped_token, snapshot.params);
}

Json ToJson(const RoundData& round) {
  return Json{
    {"roundId", round.round_id.str()},
    {"answer", round.answer.str()},
    {"startedAt", round.started_at.str()},
    {"updatedAt", round.updated_at.str()},
    {"answeredInRound", round.answered_in_round.str()},
  };
}
