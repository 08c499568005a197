#include "oracle/asset_registry.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include "utils/utf8.hpp"

void AssetRegistry::Register(IStorage& storage,
                             const CanonicalAddr& caller,
                             const std::string& symbol,
                             const CanonicalAddr& feeder,
                             const CanonicalAddr& token) {
  if (!IsValidUtf8(symbol)) throw ContractError::InvalidInput("asset symbol is not valid UTF-8");
  if (State::MaybeReadAsset(storage, symbol)) {
    throw ContractError::AlreadyExists("asset already registered: " + symbol);
  }

  // Price record first: an asset is never visible without its price.
  State::StorePrice(storage, symbol, PriceRecord{Decimal::Zero(), Decimal::One(), 0});
  State::StoreAsset(storage, Asset{symbol, feeder, token});
  Logger::Info("asset registered: " + symbol + " by 0x" + BytesToHex(caller.bytes));
}

Asset AssetRegistry::Read(const IReadonlyStorage& storage, const std::string& symbol) {
  return State::ReadAsset(storage, symbol);
}
