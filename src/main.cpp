#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/host_config.hpp"
#include "host/cli.hpp"
#include "telemetry/structured_logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  HostConfig cfg;
  try {
    ConfigManager::Initialize(".env");
    cfg = LoadHostConfig();
  } catch (const std::exception& e) {
    std::cerr << "config error: " << e.what() << std::endl;
    return kExitConfig;
  }
  Logger::Initialize(cfg.log_file, cfg.log_level, true);
  StructuredLogger::Instance().Initialize(cfg.metrics_file);

  const int rc = RunCommand(cfg, args, std::cout, std::cerr);
  if (rc == kExitUsage) PrintUsage(std::cerr, argv[0]);

  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
  return rc;
}
