#include "oracle/contract.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "oracle/asset_registry.hpp"
#include "oracle/config_store.hpp"
#include "oracle/price_ledger.hpp"

InitResponse OracleContract::Init(IStorage& storage, const IAddressApi& api, const Env& env, const InitMsg& msg) {
  StorageTransaction tx(storage);
  ConfigStore::Initialize(tx, api.CanonicalAddress(msg.owner), msg.base_denom);
  tx.Commit();
  Logger::Info("oracle instantiated at " + env.contract.address + " by " + env.message.sender);
  return InitResponse{};
}

HandleResponse OracleContract::Handle(IStorage& storage, const IAddressApi& api, const Env& env, const HandleMsg& msg) {
  StorageTransaction tx(storage);
  HandleResponse res;
  try {
    if (auto update = std::get_if<UpdateConfigMsg>(&msg)) {
      res = TryUpdateConfig(tx, api, env, *update);
    } else if (auto reg = std::get_if<RegisterAssetMsg>(&msg)) {
      res = TryRegisterAsset(tx, api, env, *reg);
    } else {
      res = TryFeedPrice(tx, api, env, std::get<FeedPriceMsg>(msg));
    }
  } catch (const ContractError& e) {
    Logger::Warning(Messages::HandleMsgName(msg) + " from " + env.message.sender + " rejected: " + e.what());
    throw;
  }
  tx.Commit();
  return res;
}

HandleResponse OracleContract::TryUpdateConfig(IStorage& storage, const IAddressApi& api, const Env& env, const UpdateConfigMsg& msg) {
  const CanonicalAddr sender = api.CanonicalAddress(env.message.sender);
  std::optional<CanonicalAddr> new_owner;
  if (msg.owner) new_owner = api.CanonicalAddress(*msg.owner);
  ConfigStore::Update(storage, sender, new_owner);
  return HandleResponse{};
}

HandleResponse OracleContract::TryRegisterAsset(IStorage& storage, const IAddressApi& api, const Env& env, const RegisterAssetMsg& msg) {
  AssetRegistry::Register(storage,
                          api.CanonicalAddress(env.message.sender),
                          msg.symbol,
                          api.CanonicalAddress(msg.feeder),
                          api.CanonicalAddress(msg.token));
  return HandleResponse{};
}

HandleResponse OracleContract::TryFeedPrice(IStorage& storage, const IAddressApi& api, const Env& env, const FeedPriceMsg& msg) {
  HandleResponse res;
  res.log = PriceLedger::FeedPrice(storage,
                                   api.CanonicalAddress(env.message.sender),
                                   msg.symbol,
                                   msg.price,
                                   msg.price_multiplier,
                                   env.block.time);
  return res;
}

std::string OracleContract::Query(const IReadonlyStorage& storage, const IAddressApi& api, const QueryMsg& msg) {
  if (auto asset = std::get_if<AssetQuery>(&msg)) return Messages::ToJson(QueryAsset(storage, api, asset->symbol));
  if (auto price = std::get_if<PriceQuery>(&msg)) return Messages::ToJson(QueryPrice(storage, price->symbol));
  return Messages::ToJson(QueryConfig(storage, api));
}

ConfigResponse OracleContract::QueryConfig(const IReadonlyStorage& storage, const IAddressApi& api) {
  const Config config = ConfigStore::Read(storage);
  return ConfigResponse{api.HumanAddress(config.owner), config.base_denom};
}

AssetResponse OracleContract::QueryAsset(const IReadonlyStorage& storage, const IAddressApi& api, const std::string& symbol) {
  const Asset asset = AssetRegistry::Read(storage, symbol);
  return AssetResponse{asset.symbol, api.HumanAddress(asset.feeder), api.HumanAddress(asset.token)};
}

PriceResponse OracleContract::QueryPrice(const IReadonlyStorage& storage, const std::string& symbol) {
  const PriceRecord record = PriceLedger::Read(storage, symbol);
  return PriceResponse{record.price, record.price_multiplier, record.last_update_time};
}
