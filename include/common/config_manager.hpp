#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <optional>

// Key/value settings from a .env file. Keys absent from the file fall back
// to the process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static void Set(const std::string& key, const std::string& value);
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static std::string GetOr(const std::string& key, const std::string& default_value);
  static int GetIntOr(const std::string& key, int default_value);
  // Throws std::runtime_error when the key is set but not an unsigned integer.
  static std::optional<uint64_t> GetUint64(const std::string& key);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
