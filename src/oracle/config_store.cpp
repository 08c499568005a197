#include "oracle/config_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/utf8.hpp"

void ConfigStore::Initialize(IStorage& storage, const CanonicalAddr& owner, const std::string& base_denom) {
  if (!IsValidUtf8(base_denom)) throw ContractError::InvalidInput("base_denom is not valid UTF-8");
  State::StoreConfig(storage, Config{owner, base_denom});
  Logger::Info("config initialized, base_denom=" + base_denom);
}

Config ConfigStore::Read(const IReadonlyStorage& storage) {
  return State::ReadConfig(storage);
}

void ConfigStore::Update(IStorage& storage, const CanonicalAddr& caller, const std::optional<CanonicalAddr>& new_owner) {
  Config config = State::ReadConfig(storage);
  if (caller != config.owner) throw ContractError::Unauthorized();

  if (new_owner) {
    config.owner = *new_owner;
    Logger::Info("config owner changed");
  }
  State::StoreConfig(storage, config);
}
