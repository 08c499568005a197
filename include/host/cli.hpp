#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "config/host_config.hpp"

// Exit codes of the reference host.
constexpr int kExitOk = 0;
constexpr int kExitHostFailure = 1;
constexpr int kExitContractError = 2;
constexpr int kExitUsage = 64;
constexpr int kExitConfig = 78;

// Runs one host command against the state file named in `cfg`:
//   init <sender> <json> | handle <sender> <json> | query <json>
// State is loaded first and written back only after a successful init or
// handle. Responses go to `out`, errors to `err`. Emits one
// "oracle_command" event through StructuredLogger.
int RunCommand(const HostConfig& cfg, const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

void PrintUsage(std::ostream& err, const std::string& program);
