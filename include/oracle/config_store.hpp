#pragma once
#include <optional>
#include <string>
#include "state/state.hpp"

class ConfigStore {
public:
  // Writes the singleton config. Called once, at contract creation.
  // Throws ContractError(InvalidInput) when base_denom is not valid UTF-8.
  static void Initialize(IStorage& storage, const CanonicalAddr& owner, const std::string& base_denom);
  static Config Read(const IReadonlyStorage& storage);
  // Only the current owner may call. An absent new_owner still performs the
  // ownership check and rewrites the config unchanged.
  static void Update(IStorage& storage, const CanonicalAddr& caller, const std::optional<CanonicalAddr>& new_owner);
};
