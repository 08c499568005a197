#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "common/logger.hpp"

class IAddressApi;

enum class AddressMode { Padded, Hex };

struct HostConfig {
  std::string state_file = "oracle_state.json";
  std::string log_file = "oracle.log";
  LogLevel log_level = LogLevel::INFO;
  std::string metrics_file = "oracle_events.jsonl";
  AddressMode address_mode = AddressMode::Padded;
  int canonical_length = 20;
  std::optional<uint64_t> block_time; // wall clock when unset
  uint64_t block_height = 1;
  std::string chain_id = "oracle-local";
  std::string contract_address = "oracle0000";
};

// Loads host settings from ConfigManager (ORACLE_* keys).
// Throws std::runtime_error on invalid values.
HostConfig LoadHostConfig();

std::unique_ptr<IAddressApi> MakeAddressApi(const HostConfig& cfg);
