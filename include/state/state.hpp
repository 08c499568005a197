#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "api/address_api.hpp"
#include "math/decimal.hpp"
#include "storage/storage.hpp"

struct Config {
  CanonicalAddr owner;
  std::string base_denom;
};

struct Asset {
  std::string symbol;
  CanonicalAddr feeder;
  CanonicalAddr token;
};

struct PriceRecord {
  Decimal price = Decimal::Zero();
  Decimal price_multiplier = Decimal::One();
  uint64_t last_update_time = 0;
};

// Persistence of the three record kinds. Records are JSON-encoded; asset and
// price records live in separate key namespaces. Read* throw
// ContractError(NotFound) when absent and ContractError(Serialization) when
// the stored bytes cannot be decoded.
namespace State {
  extern const char* const kConfigKey;
  extern const char* const kAssetPrefix;
  extern const char* const kPricePrefix;

  std::string ConfigStorageKey();
  std::string AssetStorageKey(const std::string& symbol);
  std::string PriceStorageKey(const std::string& symbol);

  void StoreConfig(IStorage& storage, const Config& config);
  Config ReadConfig(const IReadonlyStorage& storage);

  void StoreAsset(IStorage& storage, const Asset& asset);
  Asset ReadAsset(const IReadonlyStorage& storage, const std::string& symbol);
  std::optional<Asset> MaybeReadAsset(const IReadonlyStorage& storage, const std::string& symbol);

  void StorePrice(IStorage& storage, const std::string& symbol, const PriceRecord& price);
  PriceRecord ReadPrice(const IReadonlyStorage& storage, const std::string& symbol);

  std::string EncodeConfig(const Config& config);
  Config DecodeConfig(const std::string& bytes);
  std::string EncodeAsset(const Asset& asset);
  Asset DecodeAsset(const std::string& bytes);
  std::string EncodePrice(const PriceRecord& price);
  PriceRecord DecodePrice(const std::string& bytes);
}
