#pragma once
#include <map>
#include <vector>
#include "oracle/price_feed.hpp"

// In-memory primary feed: a fixed history of rounds, e.g. loaded from a snapshot.
class StaticPriceFeed : public PriceFeed {
public:
  StaticPriceFeed(uint8_t decimals, std::string description, const std::vector<RoundData>& rounds = {});

  uint8_t Decimals() const override { return decimals_; }
  std::string Description() const override { return description_; }
  uint256_t Version() const override { return 1; }
  // std::out_of_range for an unknown round, as an aggregator reverts with "No data present".
  RoundData GetRoundData(const uint80_t& round_id) const override;
  RoundData LatestRoundData() const override;

  // Round ids must strictly increase; ConfigurationError otherwise.
  void PushRound(const RoundData& round);
  size_t RoundCount() const { return rounds_.size(); }

private:
  uint8_t decimals_;
  std::string description_;
  std::map<uint80_t, RoundData> rounds_;
};
