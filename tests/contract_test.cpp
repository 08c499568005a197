#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "oracle/contract.hpp"
#include "state/state.hpp"

namespace {

class RecordingStorage : public MemoryStorage {
public:
  void Set(const std::string& key, const std::string& value) override {
    ++writes;
    MemoryStorage::Set(key, value);
  }
  int writes = 0;
};

Env MockEnv(const std::string& sender, uint64_t time = 1571797419) {
  Env env;
  env.block.height = 12345;
  env.block.time = time;
  env.block.chain_id = "cosmos-testnet-14002";
  env.message.sender = sender;
  env.contract.address = "cosmos2contract";
  return env;
}

ErrorKind HandleError(IStorage& store, const IAddressApi& api, const Env& env, const HandleMsg& msg) {
  try {
    OracleContract::Handle(store, api, env, msg);
  } catch (const ContractError& e) {
    return e.Kind();
  }
  ADD_FAILURE() << "handle unexpectedly succeeded";
  return ErrorKind::Serialization;
}

}  // namespace

class OracleContractTest : public ::testing::Test {
protected:
  void SetUp() override {
    OracleContract::Init(store_, api_, MockEnv("addr0000"), InitMsg{"owner0000", "base0000"});
  }
  PaddedAddressApi api_;
  RecordingStorage store_;
};

TEST_F(OracleContractTest, ProperInitialization) {
  ConfigResponse c = OracleContract::QueryConfig(store_, api_);
  EXPECT_EQ(c.owner, "owner0000");
  EXPECT_EQ(c.base_denom, "base0000");
}

TEST_F(OracleContractTest, UpdateConfig) {
  HandleResponse res = OracleContract::Handle(store_, api_, MockEnv("owner0000"), UpdateConfigMsg{std::string("owner0001")});
  EXPECT_TRUE(res.log.empty());
  EXPECT_EQ(OracleContract::QueryConfig(store_, api_), (ConfigResponse{"owner0001", "base0000"}));

  EXPECT_EQ(HandleError(store_, api_, MockEnv("owner0000"), UpdateConfigMsg{std::nullopt}), ErrorKind::Unauthorized);
  EXPECT_EQ(OracleContract::QueryConfig(store_, api_).owner, "owner0001");
}

TEST_F(OracleContractTest, FeedPriceScenario) {
  EXPECT_EQ(HandleError(store_, api_, MockEnv("addr0000"),
                        FeedPriceMsg{"uusd", Decimal::FromString("1.2"), std::nullopt}),
            ErrorKind::NotFound);

  OracleContract::Handle(store_, api_, MockEnv("addr0000"), RegisterAssetMsg{"mAPPL", "addr0000", "asset0000"});
  EXPECT_EQ(OracleContract::QueryAsset(store_, api_, "mAPPL"), (AssetResponse{"mAPPL", "addr0000", "asset0000"}));
  EXPECT_EQ(OracleContract::QueryPrice(store_, "mAPPL"), (PriceResponse{Decimal::Zero(), Decimal::One(), 0}));

  Env env = MockEnv("addr0000");
  HandleResponse res = OracleContract::Handle(store_, api_, env, FeedPriceMsg{"mAPPL", Decimal::FromString("1.2"), std::nullopt});
  ASSERT_EQ(res.log.size(), 2u);
  EXPECT_EQ(res.log[0].value, "price_feed");
  EXPECT_EQ(res.log[1].value, "1.2");
  EXPECT_EQ(OracleContract::QueryPrice(store_, "mAPPL"),
            (PriceResponse{Decimal::FromString("1.2"), Decimal::One(), env.block.time}));

  EXPECT_EQ(HandleError(store_, api_, MockEnv("addr0001"),
                        FeedPriceMsg{"mAPPL", Decimal::FromString("1.2"), std::nullopt}),
            ErrorKind::Unauthorized);
}

TEST_F(OracleContractTest, FailedCommandsWriteNothing) {
  OracleContract::Handle(store_, api_, MockEnv("addr0000"), RegisterAssetMsg{"mAPPL", "addr0000", "asset0000"});
  const int writes = store_.writes;
  const auto snapshot = store_.Entries();

  HandleError(store_, api_, MockEnv("addr0009"), RegisterAssetMsg{"mAPPL", "addr0009", "asset0009"});
  HandleError(store_, api_, MockEnv("addr0000"), RegisterAssetMsg{"mGOOG", "addr0000", "x"});
  HandleError(store_, api_, MockEnv("addr0001"), FeedPriceMsg{"mAPPL", Decimal::One(), Decimal::One()});
  HandleError(store_, api_, MockEnv("owner0000"), UpdateConfigMsg{std::string("no")});

  EXPECT_EQ(store_.writes, writes);
  EXPECT_EQ(store_.Entries(), snapshot);
  EXPECT_THROW(OracleContract::QueryAsset(store_, api_, "mGOOG"), ContractError);
  EXPECT_THROW(OracleContract::QueryPrice(store_, "mGOOG"), ContractError);
}

TEST_F(OracleContractTest, DuplicateRegistrationIsAlreadyExists) {
  OracleContract::Handle(store_, api_, MockEnv("addr0000"), RegisterAssetMsg{"mAPPL", "addr0000", "asset0000"});
  EXPECT_EQ(HandleError(store_, api_, MockEnv("owner0000"), RegisterAssetMsg{"mAPPL", "addr0001", "asset0001"}),
            ErrorKind::AlreadyExists);
  EXPECT_EQ(OracleContract::QueryAsset(store_, api_, "mAPPL").feeder, "addr0000");
}

TEST_F(OracleContractTest, QueriesAreIdempotentAndJsonEncoded) {
  OracleContract::Handle(store_, api_, MockEnv("addr0000"), RegisterAssetMsg{"mAPPL", "addr0000", "asset0000"});
  const IReadonlyStorage& view = store_;

  const std::string config = OracleContract::Query(view, api_, ConfigQuery{});
  EXPECT_EQ(config, "{\"base_denom\":\"base0000\",\"owner\":\"owner0000\"}");
  EXPECT_EQ(OracleContract::Query(view, api_, ConfigQuery{}), config);

  EXPECT_EQ(OracleContract::Query(view, api_, AssetQuery{"mAPPL"}),
            "{\"feeder\":\"addr0000\",\"symbol\":\"mAPPL\",\"token\":\"asset0000\"}");
  const std::string price = OracleContract::Query(view, api_, PriceQuery{"mAPPL"});
  EXPECT_EQ(price, "{\"last_update_time\":0,\"price\":\"0\",\"price_multiplier\":\"1\"}");
  EXPECT_EQ(OracleContract::Query(view, api_, PriceQuery{"mAPPL"}), price);
}

TEST(OracleContractHexTest, FeederMatchedRegardlessOfCase) {
  HexAddressApi api;
  MemoryStorage store;
  const std::string owner = "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed";
  const std::string feeder = "0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359";
  const std::string token = "0xdbf03b407c01e7cd3cbea99509d93f8dddc8c6fb";

  OracleContract::Init(store, api, MockEnv(owner), InitMsg{owner, "uusd"});
  OracleContract::Handle(store, api, MockEnv(owner), RegisterAssetMsg{"mAPPL", feeder, token});
  OracleContract::Handle(store, api, MockEnv("0xFB6916095CA1DF60BB79CE92CE3EA74C37C5D359"),
                         FeedPriceMsg{"mAPPL", Decimal::FromString("101.25"), std::nullopt});

  AssetResponse asset = OracleContract::QueryAsset(store, api, "mAPPL");
  EXPECT_EQ(asset.feeder, "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359");
  EXPECT_EQ(OracleContract::QueryPrice(store, "mAPPL").price, Decimal::FromString("101.25"));
  EXPECT_EQ(OracleContract::QueryConfig(store, api).owner, "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
}

TEST_F(OracleContractTest, NonUtf8InputIsInvalidInputAndWritesNothing) {
  const int writes = store_.writes;
  EXPECT_EQ(HandleError(store_, api_, MockEnv("addr0000"), RegisterAssetMsg{"m\xff", "addr0000", "asset0000"}),
            ErrorKind::InvalidInput);
  EXPECT_EQ(HandleError(store_, api_, MockEnv("addr0000"),
                        RegisterAssetMsg{"mAPPL", "\xff\xfe\xfd" "addr", "asset0000"}),
            ErrorKind::InvalidInput);
  EXPECT_EQ(HandleError(store_, api_, MockEnv("\xff\xfe\xfd" "addr"),
                        RegisterAssetMsg{"mAPPL", "addr0000", "asset0000"}),
            ErrorKind::InvalidInput);
  EXPECT_EQ(store_.writes, writes);
}

TEST(OracleContractInitTest, NonUtf8BaseDenomIsInvalidInput) {
  PaddedAddressApi api;
  MemoryStorage store;
  try {
    OracleContract::Init(store, api, MockEnv("addr0000"), InitMsg{"owner0000", "u\xc3"});
    FAIL() << "expected InvalidInput";
  } catch (const ContractError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidInput);
  }
  EXPECT_EQ(store.Size(), 0u);
}
