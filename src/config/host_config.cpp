#include "config/host_config.hpp"
#include "api/address_api.hpp"
#include "common/config_manager.hpp"
#include <stdexcept>

HostConfig LoadHostConfig() {
  HostConfig cfg;
  cfg.state_file = ConfigManager::GetOr("ORACLE_STATE_FILE", cfg.state_file);
  cfg.log_file = ConfigManager::GetOr("ORACLE_LOG_FILE", cfg.log_file);
  cfg.metrics_file = ConfigManager::GetOr("ORACLE_METRICS_FILE", cfg.metrics_file);

  if (auto lvl = ConfigManager::Get("ORACLE_LOG_LEVEL")) {
    auto parsed = Logger::ParseLevel(*lvl);
    if (!parsed) throw std::runtime_error("unknown ORACLE_LOG_LEVEL: " + *lvl);
    cfg.log_level = *parsed;
  }

  const std::string mode = ConfigManager::GetOr("ORACLE_ADDRESS_MODE", "padded");
  if (mode == "padded") cfg.address_mode = AddressMode::Padded;
  else if (mode == "hex") cfg.address_mode = AddressMode::Hex;
  else throw std::runtime_error("unknown ORACLE_ADDRESS_MODE: " + mode);

  cfg.canonical_length = ConfigManager::GetIntOr("ORACLE_CANONICAL_LENGTH", cfg.canonical_length);
  if (cfg.canonical_length < static_cast<int>(PaddedAddressApi::kMinHumanLength)) {
    throw std::runtime_error("ORACLE_CANONICAL_LENGTH must be at least 3");
  }

  cfg.block_time = ConfigManager::GetUint64("ORACLE_BLOCK_TIME");
  if (auto h = ConfigManager::GetUint64("ORACLE_BLOCK_HEIGHT")) cfg.block_height = *h;
  cfg.chain_id = ConfigManager::GetOr("ORACLE_CHAIN_ID", cfg.chain_id);
  cfg.contract_address = ConfigManager::GetOr("ORACLE_CONTRACT_ADDRESS", cfg.contract_address);
  return cfg;
}

std::unique_ptr<IAddressApi> MakeAddressApi(const HostConfig& cfg) {
  if (cfg.address_mode == AddressMode::Hex) return std::unique_ptr<IAddressApi>(new HexAddressApi());
  return std::unique_ptr<IAddressApi>(new PaddedAddressApi(static_cast<size_t>(cfg.canonical_length)));
}
