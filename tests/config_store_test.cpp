#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "oracle/config_store.hpp"

class ConfigStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    owner_ = api_.CanonicalAddress("owner0000");
    ConfigStore::Initialize(store_, owner_, "base0000");
  }
  PaddedAddressApi api_;
  MemoryStorage store_;
  CanonicalAddr owner_;
};

TEST(ConfigStoreEmptyTest, ReadBeforeInitializeIsNotFound) {
  MemoryStorage store;
  try {
    ConfigStore::Read(store);
    FAIL() << "expected NotFound";
  } catch (const ContractError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::NotFound);
  }
}

TEST_F(ConfigStoreTest, InitializeWritesConfig) {
  Config c = ConfigStore::Read(store_);
  EXPECT_EQ(c.owner, owner_);
  EXPECT_EQ(c.base_denom, "base0000");
}

TEST_F(ConfigStoreTest, OwnerCanTransferOwnership) {
  CanonicalAddr next = api_.CanonicalAddress("owner0001");
  ConfigStore::Update(store_, owner_, next);
  Config c = ConfigStore::Read(store_);
  EXPECT_EQ(c.owner, next);
  EXPECT_EQ(c.base_denom, "base0000");

  // previous owner lost its rights
  try {
    ConfigStore::Update(store_, owner_, std::nullopt);
    FAIL() << "expected Unauthorized";
  } catch (const ContractError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::Unauthorized);
  }
}

TEST_F(ConfigStoreTest, UpdateWithoutOwnerIsAuthorizedNoop) {
  const auto before = *store_.Get(State::ConfigStorageKey());
  ConfigStore::Update(store_, owner_, std::nullopt);
  EXPECT_EQ(*store_.Get(State::ConfigStorageKey()), before);
}

TEST_F(ConfigStoreTest, NonOwnerRejectedAndConfigUnchanged) {
  const auto before = *store_.Get(State::ConfigStorageKey());
  CanonicalAddr intruder = api_.CanonicalAddress("addr0000");
  EXPECT_THROW(ConfigStore::Update(store_, intruder, intruder), ContractError);
  EXPECT_EQ(*store_.Get(State::ConfigStorageKey()), before);
}
