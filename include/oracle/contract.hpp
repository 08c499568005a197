#pragma once
#include <string>
#include "api/address_api.hpp"
#include "oracle/messages.hpp"
#include "storage/storage.hpp"

// Entry points called by the host. Commands run inside a StorageTransaction
// and reach `storage` only when they succeed; every failure is thrown as a
// ContractError and leaves `storage` untouched.
class OracleContract {
public:
  static InitResponse Init(IStorage& storage, const IAddressApi& api, const Env& env, const InitMsg& msg);
  static HandleResponse Handle(IStorage& storage, const IAddressApi& api, const Env& env, const HandleMsg& msg);

  // Returns the JSON-encoded response record.
  static std::string Query(const IReadonlyStorage& storage, const IAddressApi& api, const QueryMsg& msg);
  static ConfigResponse QueryConfig(const IReadonlyStorage& storage, const IAddressApi& api);
  static AssetResponse QueryAsset(const IReadonlyStorage& storage, const IAddressApi& api, const std::string& symbol);
  static PriceResponse QueryPrice(const IReadonlyStorage& storage, const std::string& symbol);
private:
  static HandleResponse TryUpdateConfig(IStorage& storage, const IAddressApi& api, const Env& env, const UpdateConfigMsg& msg);
  static HandleResponse TryRegisterAsset(IStorage& storage, const IAddressApi& api, const Env& env, const RegisterAssetMsg& msg);
  static HandleResponse TryFeedPrice(IStorage& storage, const IAddressApi& api, const Env& env, const FeedPriceMsg& msg);
};
