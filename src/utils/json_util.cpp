#include "utils/json_util.hpp"
#include "math/decimal.hpp"
#include "common/errors.hpp"
#include <fstream>

namespace JsonUtil {
  Json ParseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw ConfigurationError("cannot open " + path);
    try {
      return Json::parse(file);
    } catch (const Json::parse_error& e) {
      throw ConfigurationError(path + ": " + e.what());
    }
  }

  const Json& Require(const Json& j, const std::string& key, const std::string& context) {
    if (!j.is_object() || !j.contains(key)) throw ConfigurationError(context + ": missing `" + key + "`");
    return j.at(key);
  }

  std::string NumberText(const Json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    throw ConfigurationError("expected number, got " + value.dump());
  }

  std::string StringOf(const Json& value, const std::string& context) {
    if (!value.is_string()) throw ConfigurationError(context + ": expected string, got " + value.dump());
    return value.get<std::string>();
  }

  uint256_t Uint256Of(const Json& value) {
    return Decimal::ParseUint256(NumberText(value));
  }

  int256_t Int256Of(const Json& value) {
    return Decimal::ParseInt256(NumberText(value));
  }

  uint8_t Uint8Of(const Json& value, const std::string& context) {
    const uint256_t v = Uint256Of(value);
    if (v > 255) throw ConfigurationError(context + ": " + v.str() + " does not fit in uint8");
    return static_cast<uint8_t>(static_cast<unsigned>(v));
  }
}
