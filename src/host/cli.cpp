#include "host/cli.hpp"
#include "api/address_api.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "oracle/contract.hpp"
#include "oracle/messages.hpp"
#include "storage/file_storage.hpp"
#include "telemetry/structured_logger.hpp"
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

void PrintUsage(std::ostream& err, const std::string& program) {
  err << "usage:\n"
      << "  " << program << " init <sender> '<init json>'\n"
      << "  " << program << " handle <sender> '<handle json>'\n"
      << "  " << program << " query '<query json>'\n";
}

static Env MakeEnv(const HostConfig& cfg, const std::string& sender) {
  Env env;
  env.block.height = cfg.block_height;
  if (cfg.block_time) {
    env.block.time = *cfg.block_time;
  } else {
    env.block.time = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
  }
  env.block.chain_id = cfg.chain_id;
  env.message.sender = sender;
  env.contract.address = cfg.contract_address;
  return env;
}

int RunCommand(const HostConfig& cfg, const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  if (args.empty()) return kExitUsage;
  const std::string& command = args[0];
  const bool is_query = command == "query";
  if ((is_query && args.size() != 2) || (!is_query && args.size() != 3) ||
      (!is_query && command != "init" && command != "handle")) {
    return kExitUsage;
  }

  const std::string sender = is_query ? std::string() : args[1];
  const std::string& body = is_query ? args[1] : args[2];
  const Env env = MakeEnv(cfg, sender);
  nlohmann::json event{{"command", command}, {"sender", sender}, {"block_time", env.block.time}};

  int rc = kExitOk;
  try {
    FileStorage storage(cfg.state_file);
    storage.Load();
    std::unique_ptr<IAddressApi> api = MakeAddressApi(cfg);

    if (command == "init") {
      InitResponse res = OracleContract::Init(storage, *api, env, Messages::ParseInitMsg(body));
      storage.Flush();
      out << Messages::ToJson(res) << std::endl;
    } else if (command == "handle") {
      HandleMsg msg = Messages::ParseHandleMsg(body);
      event["msg"] = Messages::HandleMsgName(msg);
      HandleResponse res = OracleContract::Handle(storage, *api, env, msg);
      storage.Flush();
      event["log"] = Messages::LogToJson(res.log);
      out << Messages::ToJson(res) << std::endl;
    } else {
      out << OracleContract::Query(storage, *api, Messages::ParseQueryMsg(body)) << std::endl;
    }
    event["ok"] = true;
  } catch (const ContractError& e) {
    err << "error[" << ErrorKindToString(e.Kind()) << "]: " << e.what() << std::endl;
    event["ok"] = false;
    event["error"] = ErrorKindToString(e.Kind());
    rc = kExitContractError;
  } catch (const std::exception& e) {
    Logger::Critical(std::string("host failure: ") + e.what());
    err << "host failure: " << e.what() << std::endl;
    event["ok"] = false;
    event["error"] = e.what();
    rc = kExitHostFailure;
  }

  StructuredLogger::Instance().LogEvent("oracle_command", event);
  return rc;
}
