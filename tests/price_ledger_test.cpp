#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "oracle/asset_registry.hpp"
#include "oracle/price_ledger.hpp"

class PriceLedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    feeder_ = api_.CanonicalAddress("addr0000");
    AssetRegistry::Register(store_, feeder_, "mAPPL", feeder_, api_.CanonicalAddress("asset0000"));
  }
  PaddedAddressApi api_;
  MemoryStorage store_;
  CanonicalAddr feeder_;
};

TEST_F(PriceLedgerTest, FeederUpdatesPriceAndTime) {
  auto log = PriceLedger::FeedPrice(store_, feeder_, "mAPPL", Decimal::FromString("1.2"), std::nullopt, 1571797419);
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0], (LogAttribute{"action", "price_feed"}));
  EXPECT_EQ(log[1], (LogAttribute{"price", "1.2"}));

  PriceRecord p = PriceLedger::Read(store_, "mAPPL");
  EXPECT_EQ(p.price, Decimal::FromString("1.2"));
  EXPECT_EQ(p.price_multiplier, Decimal::One());
  EXPECT_EQ(p.last_update_time, 1571797419u);
}

TEST_F(PriceLedgerTest, MultiplierCarriesOverUnlessSupplied) {
  PriceLedger::FeedPrice(store_, feeder_, "mAPPL", Decimal::FromString("2"), Decimal::FromString("0.5"), 100);
  EXPECT_EQ(PriceLedger::Read(store_, "mAPPL").price_multiplier, Decimal::FromString("0.5"));

  PriceLedger::FeedPrice(store_, feeder_, "mAPPL", Decimal::FromString("2.5"), std::nullopt, 200);
  PriceRecord p = PriceLedger::Read(store_, "mAPPL");
  EXPECT_EQ(p.price, Decimal::FromString("2.5"));
  EXPECT_EQ(p.price_multiplier, Decimal::FromString("0.5"));
  EXPECT_EQ(p.last_update_time, 200u);
}

TEST_F(PriceLedgerTest, OtherCallerRejectedAndRecordUnchanged) {
  const auto before = *store_.Get(State::PriceStorageKey("mAPPL"));
  try {
    PriceLedger::FeedPrice(store_, api_.CanonicalAddress("addr0001"), "mAPPL", Decimal::FromString("9"), std::nullopt, 5);
    FAIL() << "expected Unauthorized";
  } catch (const ContractError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::Unauthorized);
  }
  EXPECT_EQ(*store_.Get(State::PriceStorageKey("mAPPL")), before);
}

TEST_F(PriceLedgerTest, UnregisteredSymbolIsNotFound) {
  try {
    PriceLedger::FeedPrice(store_, feeder_, "uusd", Decimal::FromString("1.2"), std::nullopt, 5);
    FAIL() << "expected NotFound";
  } catch (const ContractError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::NotFound);
    EXPECT_STREQ(e.what(), "no asset data stored");
  }
  EXPECT_FALSE(store_.Get(State::PriceStorageKey("uusd")).has_value());
}

TEST_F(PriceLedgerTest, ZeroPriceAccepted) {
  PriceLedger::FeedPrice(store_, feeder_, "mAPPL", Decimal::FromString("4"), std::nullopt, 1);
  PriceLedger::FeedPrice(store_, feeder_, "mAPPL", Decimal::Zero(), std::nullopt, 2);
  EXPECT_TRUE(PriceLedger::Read(store_, "mAPPL").price.IsZero());
}
