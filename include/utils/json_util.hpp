#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "common/int_types.hpp"

// Keys keep file order, so assets are reported in the order they were declared.
using Json = nlohmann::ordered_json;

namespace JsonUtil {
  // Parses a whole file; ConfigurationError if it cannot be opened or is not JSON.
  Json ParseFile(const std::string& path);
  // Returns j[key]; ConfigurationError naming `context` when missing.
  const Json& Require(const Json& j, const std::string& key, const std::string& context);
  // Text of a numeric field as written: strings pass through, numbers are printed
  // with their shortest round-trip form (0.9 -> "0.9", 5e23 -> "5e+23").
  std::string NumberText(const Json& value);
  std::string StringOf(const Json& value, const std::string& context);

  uint256_t Uint256Of(const Json& value);
  int256_t Int256Of(const Json& value);
  uint8_t Uint8Of(const Json& value, const std::string& context);
}
