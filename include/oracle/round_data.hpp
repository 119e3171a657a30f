#pragma once
#include "common/int_types.hpp"

// One aggregator observation, in the shape latestRoundData()/getRoundData() return.
struct RoundData {
  uint80_t round_id = 0;
  int256_t answer = 0;
  uint256_t started_at = 0;
  uint256_t updated_at = 0;
  uint80_t answered_in_round = 0;
};

inline bool operator==(const RoundData& a, const RoundData& b) {
  return a.round_id == b.round_id && a.answer == b.answer && a.started_at == b.started_at &&
         a.updated_at == b.updated_at && a.answered_in_round == b.answered_in_round;
}
inline bool operator!=(const RoundData& a, const RoundData& b) { return !(a == b); }
