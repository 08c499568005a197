#pragma once
#include <string>
#include "state/state.hpp"

class AssetRegistry {
public:
  // Registers `symbol` with its feeder and token and seeds its price record
  // with {price 0, multiplier 1, time 0}. Registration is open: `caller` is
  // not checked against the owner. Throws ContractError(AlreadyExists) when
  // the symbol is already registered, InvalidInput when it is not valid UTF-8.
  static void Register(IStorage& storage,
                       const CanonicalAddr& caller,
                       const std::string& symbol,
                       const CanonicalAddr& feeder,
                       const CanonicalAddr& token);
  static Asset Read(const IReadonlyStorage& storage, const std::string& symbol);
};
