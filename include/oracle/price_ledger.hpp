#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "oracle/messages.hpp"
#include "state/state.hpp"

class PriceLedger {
public:
  // Feeder-only. Overwrites price and last_update_time, and the multiplier
  // only when one is given. Returns the log attributes of the update.
  // Throws NotFound for unregistered symbols, Unauthorized for other callers.
  static std::vector<LogAttribute> FeedPrice(IStorage& storage,
                                             const CanonicalAddr& caller,
                                             const std::string& symbol,
                                             const Decimal& price,
                                             const std::optional<Decimal>& price_multiplier,
                                             uint64_t block_time);
  static PriceRecord Read(const IReadonlyStorage& storage, const std::string& symbol);
};
