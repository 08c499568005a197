#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <cstdlib>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  auto start = input.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return std::string();
  auto end = input.find_last_not_of(" \t\r\n");
  return input.substr(start, end - start + 1);
}

static inline std::string StripQuotes(const std::string& v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Debug(".env file not found: " + env_path);
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    if (key.rfind("export ", 0) == 0) key = TrimWhitespace(key.substr(7));
    std::string value = StripQuotes(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
  cache_[key] = value;
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  return std::nullopt;
}

std::string ConfigManager::GetOrThrow(const std::string& key) {
  auto v = Get(key);
  if (!v) throw std::runtime_error("Missing required config: " + key);
  return *v;
}

std::string ConfigManager::GetOr(const std::string& key, const std::string& default_value) {
  return Get(key).value_or(default_value);
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    return std::stoi(*v);
  } catch (const std::exception&) {
    Logger::Warning("config " + key + " is not an integer, using default");
    return default_value;
  }
}

std::optional<uint64_t> ConfigManager::GetUint64(const std::string& key) {
  auto v = Get(key);
  if (!v) return std::nullopt;
  if (v->empty() || !std::all_of(v->begin(), v->end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
    throw std::runtime_error("config " + key + " must be an unsigned integer, got '" + *v + "'");
  }
  try {
    return static_cast<uint64_t>(std::stoull(*v));
  } catch (const std::out_of_range&) {
    throw std::runtime_error("config " + key + " is out of range");
  }
}
