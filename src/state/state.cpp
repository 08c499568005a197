#include "state/state.hpp"
#include "common/errors.hpp"
#include "storage/keys.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace State {
  const char* const kConfigKey = "config";
  const char* const kAssetPrefix = "asset";
  const char* const kPricePrefix = "price";

  std::string ConfigStorageKey() { return StorageKeys::LengthPrefixed(kConfigKey); }
  std::string AssetStorageKey(const std::string& symbol) { return StorageKeys::Namespaced(kAssetPrefix, symbol); }
  std::string PriceStorageKey(const std::string& symbol) { return StorageKeys::Namespaced(kPricePrefix, symbol); }

  static CanonicalAddr AddrFromJson(const json& j) {
    return CanonicalAddr{HexToBytes(j.get<std::string>())};
  }

  // Wraps decode failures of any layer (json, hex, decimal) as Serialization.
  template <typename Fn>
  static auto Decode(const char* what, const std::string& bytes, Fn fn) -> decltype(fn(json())) {
    try {
      return fn(json::parse(bytes));
    } catch (const json::exception& e) {
      throw ContractError::Serialization(std::string(what) + ": " + e.what());
    } catch (const std::invalid_argument& e) {
      throw ContractError::Serialization(std::string(what) + ": " + e.what());
    } catch (const ContractError& e) {
      throw ContractError::Serialization(std::string(what) + ": " + e.what());
    }
  }

  std::string EncodeConfig(const Config& config) {
    json j{{"owner", BytesToHex(config.owner.bytes)}, {"base_denom", config.base_denom}};
    return j.dump();
  }

  Config DecodeConfig(const std::string& bytes) {
    return Decode("Config", bytes, [](const json& j) {
      Config c;
      c.owner = AddrFromJson(j.at("owner"));
      c.base_denom = j.at("base_denom").get<std::string>();
      return c;
    });
  }

  std::string EncodeAsset(const Asset& asset) {
    json j{{"symbol", asset.symbol},
           {"feeder", BytesToHex(asset.feeder.bytes)},
           {"token", BytesToHex(asset.token.bytes)}};
    return j.dump();
  }

  Asset DecodeAsset(const std::string& bytes) {
    return Decode("Asset", bytes, [](const json& j) {
      Asset a;
      a.symbol = j.at("symbol").get<std::string>();
      a.feeder = AddrFromJson(j.at("feeder"));
      a.token = AddrFromJson(j.at("token"));
      return a;
    });
  }

  std::string EncodePrice(const PriceRecord& price) {
    json j{{"price", price.price.ToString()},
           {"price_multiplier", price.price_multiplier.ToString()},
           {"last_update_time", price.last_update_time}};
    return j.dump();
  }

  PriceRecord DecodePrice(const std::string& bytes) {
    return Decode("Price", bytes, [](const json& j) {
      PriceRecord p;
      p.price = Decimal::FromString(j.at("price").get<std::string>());
      p.price_multiplier = Decimal::FromString(j.at("price_multiplier").get<std::string>());
      p.last_update_time = j.at("last_update_time").get<uint64_t>();
      return p;
    });
  }

  void StoreConfig(IStorage& storage, const Config& config) {
    storage.Set(ConfigStorageKey(), EncodeConfig(config));
  }

  Config ReadConfig(const IReadonlyStorage& storage) {
    auto raw = storage.Get(ConfigStorageKey());
    if (!raw) throw ContractError::NotFound("no config data stored");
    return DecodeConfig(*raw);
  }

  void StoreAsset(IStorage& storage, const Asset& asset) {
    storage.Set(AssetStorageKey(asset.symbol), EncodeAsset(asset));
  }

  std::optional<Asset> MaybeReadAsset(const IReadonlyStorage& storage, const std::string& symbol) {
    auto raw = storage.Get(AssetStorageKey(symbol));
    if (!raw) return std::nullopt;
    return DecodeAsset(*raw);
  }

  Asset ReadAsset(const IReadonlyStorage& storage, const std::string& symbol) {
    auto asset = MaybeReadAsset(storage, symbol);
    if (!asset) throw ContractError::NotFound("no asset data stored");
    return *asset;
  }

  void StorePrice(IStorage& storage, const std::string& symbol, const PriceRecord& price) {
    storage.Set(PriceStorageKey(symbol), EncodePrice(price));
  }

  PriceRecord ReadPrice(const IReadonlyStorage& storage, const std::string& symbol) {
    auto raw = storage.Get(PriceStorageKey(symbol));
    if (!raw) throw ContractError::NotFound("no price data stored");
    return DecodePrice(*raw);
  }
}
