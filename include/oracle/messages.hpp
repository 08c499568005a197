#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "api/address_api.hpp"
#include "math/decimal.hpp"

// Invocation context supplied by the host.
struct Env {
  struct Block {
    uint64_t height = 0;
    uint64_t time = 0;
    std::string chain_id;
  } block;
  struct Message {
    HumanAddr sender;
  } message;
  struct Contract {
    HumanAddr address;
  } contract;
};

struct InitMsg {
  HumanAddr owner;
  std::string base_denom;
};

struct UpdateConfigMsg {
  std::optional<HumanAddr> owner;
};

struct RegisterAssetMsg {
  std::string symbol;
  HumanAddr feeder;
  HumanAddr token;
};

struct FeedPriceMsg {
  std::string symbol;
  Decimal price;
  std::optional<Decimal> price_multiplier;
};

using HandleMsg = std::variant<UpdateConfigMsg, RegisterAssetMsg, FeedPriceMsg>;

struct ConfigQuery {};
struct AssetQuery { std::string symbol; };
struct PriceQuery { std::string symbol; };

using QueryMsg = std::variant<ConfigQuery, AssetQuery, PriceQuery>;

struct LogAttribute {
  std::string key;
  std::string value;

  bool operator==(const LogAttribute& o) const { return key == o.key && value == o.value; }
};

struct InitResponse {
  std::vector<LogAttribute> log;
};

struct HandleResponse {
  std::vector<LogAttribute> log;
  std::optional<std::string> data;
};

struct ConfigResponse {
  HumanAddr owner;
  std::string base_denom;

  bool operator==(const ConfigResponse& o) const { return owner == o.owner && base_denom == o.base_denom; }
};

struct AssetResponse {
  std::string symbol;
  HumanAddr feeder;
  HumanAddr token;

  bool operator==(const AssetResponse& o) const {
    return symbol == o.symbol && feeder == o.feeder && token == o.token;
  }
};

struct PriceResponse {
  Decimal price;
  Decimal price_multiplier;
  uint64_t last_update_time = 0;

  bool operator==(const PriceResponse& o) const {
    return price == o.price && price_multiplier == o.price_multiplier && last_update_time == o.last_update_time;
  }
};

// JSON wire form. Parse* throw ContractError(InvalidInput) on malformed input.
namespace Messages {
  InitMsg ParseInitMsg(const std::string& body);
  HandleMsg ParseHandleMsg(const std::string& body);
  QueryMsg ParseQueryMsg(const std::string& body);

  // snake_case variant name, e.g. "feed_price"
  std::string HandleMsgName(const HandleMsg& msg);

  std::string ToJson(const HandleMsg& msg);
  std::string ToJson(const ConfigResponse& resp);
  std::string ToJson(const AssetResponse& resp);
  std::string ToJson(const PriceResponse& resp);
  std::string ToJson(const InitResponse& resp);
  std::string ToJson(const HandleResponse& resp);
  // [{"key": .., "value": ..}, ..]
  nlohmann::json LogToJson(const std::vector<LogAttribute>& log);
}
