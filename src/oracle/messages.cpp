#include "oracle/messages.hpp"
#include "common/errors.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace Messages {
  static json ParseObject(const std::string& body, const char* what) {
    json j;
    try {
      j = json::parse(body);
    } catch (const json::parse_error& e) {
      throw ContractError::InvalidInput(std::string(what) + " is not valid JSON: " + e.what());
    }
    if (!j.is_object()) throw ContractError::InvalidInput(std::string(what) + " must be a JSON object");
    return j;
  }

  static std::string RequireString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end()) throw ContractError::InvalidInput(std::string("missing field `") + field + "`");
    if (!it->is_string()) throw ContractError::InvalidInput(std::string("field `") + field + "` must be a string");
    return it->get<std::string>();
  }

  static std::optional<std::string> OptionalString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) throw ContractError::InvalidInput(std::string("field `") + field + "` must be a string or null");
    return it->get<std::string>();
  }

  // Externally tagged enum: {"variant": {...}}
  static std::pair<std::string, json> SplitVariant(const json& j, const char* what) {
    if (j.size() != 1) throw ContractError::InvalidInput(std::string(what) + " must have exactly one variant");
    auto it = j.begin();
    if (!it.value().is_object()) {
      throw ContractError::InvalidInput(std::string(what) + " variant `" + it.key() + "` must be an object");
    }
    return {it.key(), it.value()};
  }

  InitMsg ParseInitMsg(const std::string& body) {
    json j = ParseObject(body, "init message");
    InitMsg msg;
    msg.owner = RequireString(j, "owner");
    msg.base_denom = RequireString(j, "base_denom");
    return msg;
  }

  HandleMsg ParseHandleMsg(const std::string& body) {
    auto variant = SplitVariant(ParseObject(body, "handle message"), "handle message");
    const json& args = variant.second;
    if (variant.first == "update_config") {
      return UpdateConfigMsg{OptionalString(args, "owner")};
    }
    if (variant.first == "register_asset") {
      return RegisterAssetMsg{RequireString(args, "symbol"), RequireString(args, "feeder"), RequireString(args, "token")};
    }
    if (variant.first == "feed_price") {
      FeedPriceMsg msg;
      msg.symbol = RequireString(args, "symbol");
      msg.price = Decimal::FromString(RequireString(args, "price"));
      if (auto m = OptionalString(args, "price_multiplier")) msg.price_multiplier = Decimal::FromString(*m);
      return msg;
    }
    throw ContractError::InvalidInput("unknown handle variant `" + variant.first + "`");
  }

  QueryMsg ParseQueryMsg(const std::string& body) {
    auto variant = SplitVariant(ParseObject(body, "query message"), "query message");
    if (variant.first == "config") return ConfigQuery{};
    if (variant.first == "asset") return AssetQuery{RequireString(variant.second, "symbol")};
    if (variant.first == "price") return PriceQuery{RequireString(variant.second, "symbol")};
    throw ContractError::InvalidInput("unknown query variant `" + variant.first + "`");
  }

  std::string HandleMsgName(const HandleMsg& msg) {
    if (std::holds_alternative<UpdateConfigMsg>(msg)) return "update_config";
    if (std::holds_alternative<RegisterAssetMsg>(msg)) return "register_asset";
    return "feed_price";
  }

  static json OptionalToJson(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
  }

  std::string ToJson(const HandleMsg& msg) {
    json args;
    if (auto update = std::get_if<UpdateConfigMsg>(&msg)) {
      args = json{{"owner", OptionalToJson(update->owner)}};
    } else if (auto reg = std::get_if<RegisterAssetMsg>(&msg)) {
      args = json{{"symbol", reg->symbol}, {"feeder", reg->feeder}, {"token", reg->token}};
    } else if (auto feed = std::get_if<FeedPriceMsg>(&msg)) {
      std::optional<std::string> mult;
      if (feed->price_multiplier) mult = feed->price_multiplier->ToString();
      args = json{{"symbol", feed->symbol}, {"price", feed->price.ToString()}, {"price_multiplier", OptionalToJson(mult)}};
    }
    return json{{HandleMsgName(msg), args}}.dump();
  }

  std::string ToJson(const ConfigResponse& resp) {
    return json{{"owner", resp.owner}, {"base_denom", resp.base_denom}}.dump();
  }

  std::string ToJson(const AssetResponse& resp) {
    return json{{"symbol", resp.symbol}, {"feeder", resp.feeder}, {"token", resp.token}}.dump();
  }

  std::string ToJson(const PriceResponse& resp) {
    return json{{"price", resp.price.ToString()},
                {"price_multiplier", resp.price_multiplier.ToString()},
                {"last_update_time", resp.last_update_time}}.dump();
  }

  json LogToJson(const std::vector<LogAttribute>& log) {
    json arr = json::array();
    for (const auto& attr : log) arr.push_back({{"key", attr.key}, {"value", attr.value}});
    return arr;
  }

  std::string ToJson(const InitResponse& resp) {
    return json{{"log", LogToJson(resp.log)}}.dump();
  }

  std::string ToJson(const HandleResponse& resp) {
    return json{{"log", LogToJson(resp.log)}, {"data", OptionalToJson(resp.data)}}.dump();
  }
}
