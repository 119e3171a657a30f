#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Key/value settings from a .env file. Variables already present in the process
// environment win over the file, as with dotenv.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  // ConfigurationError when the key is missing.
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  static void Set(const std::string& key, const std::string& value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
