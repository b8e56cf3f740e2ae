#pragma once
#include "common/logger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ResolverConfig {
  std::string unit_of_account = "USD";
  // Applied in order; later snapshots relay on top of earlier ones.
  std::vector<std::string> snapshot_paths;
  // Fixed execution timestamp; wall clock when unset.
  std::optional<std::uint64_t> fixed_now;
  LoggerOptions log;
  std::string audit_log_path; // empty disables the JSON-lines audit
};

// Reads REF_UNIT_OF_ACCOUNT, REF_SNAPSHOT_PATH, REF_NOW, LOG_PATH, LOG_LEVEL,
// LOG_STDERR and AUDIT_LOG_PATH through ConfigManager.
ResolverConfig LoadResolverConfig();
