#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// KEY=VALUE settings from a .env file. Process environment variables of the
// same name take precedence over the file.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
  // False when the last Initialize found no file at env_path.
  static bool EnvFileLoaded();
  static std::optional<std::string> Get(const std::string& key);
  static std::uint64_t GetU64Or(const std::string& key, std::uint64_t default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Comma separated, empty items dropped.
  static std::vector<std::string> GetList(const std::string& key);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static bool env_file_loaded_;
  static void LoadEnvFile(const std::string& env_path);
};
