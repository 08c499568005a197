#include "oracle/price_ledger.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

std::vector<LogAttribute> PriceLedger::FeedPrice(IStorage& storage,
                                                 const CanonicalAddr& caller,
                                                 const std::string& symbol,
                                                 const Decimal& price,
                                                 const std::optional<Decimal>& price_multiplier,
                                                 uint64_t block_time) {
  const Asset asset = State::ReadAsset(storage, symbol);
  if (caller != asset.feeder) throw ContractError::Unauthorized();

  PriceRecord record = State::ReadPrice(storage, symbol);
  record.last_update_time = block_time;
  record.price = price;
  if (price_multiplier) record.price_multiplier = *price_multiplier;

  State::StorePrice(storage, symbol, record);
  Logger::Info("price_feed " + symbol + " price=" + price.ToString() +
               " multiplier=" + record.price_multiplier.ToString() +
               " time=" + std::to_string(block_time));

  return {
    LogAttribute{"action", "price_feed"},
    LogAttribute{"price", price.ToString()},
  };
}

PriceRecord PriceLedger::Read(const IReadonlyStorage& storage, const std::string& symbol) {
  return State::ReadPrice(storage, symbol);
}
