#include "config/resolver_config.hpp"
#include "common/config_manager.hpp"
#include "constants/reference.hpp"
#include <stdexcept>

ResolverConfig LoadResolverConfig() {
  ResolverConfig cfg;
  cfg.unit_of_account = ConfigManager::Get("REF_UNIT_OF_ACCOUNT").value_or(ReferenceConstants::UNIT_OF_ACCOUNT);
  if (cfg.unit_of_account.empty()) throw std::invalid_argument("REF_UNIT_OF_ACCOUNT must not be empty");
  cfg.snapshot_paths = ConfigManager::GetList("REF_SNAPSHOT_PATH");
  if (auto now = ConfigManager::Get("REF_NOW")) {
    if (!now->empty()) cfg.fixed_now = ConfigManager::GetU64Or("REF_NOW", 0);
  }
  cfg.log.path = ConfigManager::Get("LOG_PATH").value_or("refrate.log");
  cfg.log.min_level = ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("INFO"));
  cfg.log.mirror_to_stderr = ConfigManager::GetBoolOr("LOG_STDERR", false);
  cfg.audit_log_path = ConfigManager::Get("AUDIT_LOG_PATH").value_or("");
  return cfg;
}
