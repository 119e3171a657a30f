#pragma once
#include <string>

namespace Crypto {
  // Returns 0x-prefixed hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
}
