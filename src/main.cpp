#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/reference_error.hpp"
#include "config/resolver_config.hpp"
#include "encoding/reference_json.hpp"
#include "oracle/ref_data_store.hpp"
#include "query/query_router.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace {
  void PrintUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--env FILE] [QUERY_JSON]\n"
              << "  QUERY_JSON defaults to stdin, e.g.\n"
              << "  {\"get_reference_data\":{\"base_symbol\":\"BTC\",\"quote_symbol\":\"USD\"}}\n";
  }

  std::uint64_t WallClockSeconds() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
  }

  void ShutdownLogs() {
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
  }
}

int main(int argc, char** argv) {
  std::string env_path = ".env";
  std::string query;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--env" && i + 1 < argc) {
      env_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    } else if (query.empty()) {
      query = arg;
    } else {
      PrintUsage(argv[0]);
      return 1;
    }
  }

  ResolverConfig cfg;
  try {
    ConfigManager::Initialize(env_path);
    cfg = LoadResolverConfig();
    Logger::Initialize(cfg.log);
    if (!cfg.audit_log_path.empty()) StructuredLogger::Instance().Initialize(cfg.audit_log_path);
  } catch (const std::exception& e) {
    std::cerr << "configuration error: " << e.what() << std::endl;
    ShutdownLogs();
    return 1;
  }

  Logger::Info("refrate_cli starting, unit of account " + cfg.unit_of_account);
  // Initialize ran before the logger existed
  if (!ConfigManager::EnvFileLoaded()) Logger::Warning(".env file not found: " + env_path);
  if (query.empty()) {
    query.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  const std::uint64_t now = cfg.fixed_now ? *cfg.fixed_now : WallClockSeconds();
  nlohmann::json audit{{"now", now}, {"query", query}};
  int rc = 0;
  try {
    RefDataStore store;
    for (const auto& path : cfg.snapshot_paths) ReferenceJson::LoadSnapshot(store, path);
    if (cfg.snapshot_paths.empty()) Logger::Warning("REF_SNAPSHOT_PATH not set, store is empty");
    std::string stored;
    for (const auto& symbol : store.Symbols()) stored += (stored.empty() ? "" : ",") + symbol;
    Logger::Debug("store holds " + std::to_string(store.Size()) + " symbols: " + stored);

    QueryRouter router(store, BulkResolver(PairResolver(SymbolResolver(cfg.unit_of_account))));
    std::string response = router.HandleRaw(query, now);
    std::cout << response << std::endl;
    audit["outcome"] = "ok";
  } catch (const ReferenceError& e) {
    Logger::Warning(std::string("query failed: ") + e.what());
    auto body = ReferenceJson::ErrorToJson(e);
    std::cout << body.dump() << std::endl;
    audit["outcome"] = body;
    rc = 2;
  } catch (const std::exception& e) {
    Logger::Error(std::string("request rejected: ") + e.what());
    std::cerr << "error: " << e.what() << std::endl;
    audit["outcome"] = {{"rejected", e.what()}};
    rc = 1;
  }

  if (StructuredLogger::Instance().IsRunning()) StructuredLogger::Instance().LogEvent("query", audit);
  ShutdownLogs();
  return rc;
}
