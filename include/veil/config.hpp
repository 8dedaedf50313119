#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil/pipeline.hpp"
#include "veil/session_registry.hpp"

namespace veil {

struct Config {
  bool enabled = true;
  RedactorOptions redactor;

  std::string analyzer_url = "http://127.0.0.1:5002";
  int analyzer_timeout_sec = 10;

  VaultOptions vault;

  std::string host = "127.0.0.1";
  int port = 18791;

  std::size_t stream_max_token_bytes = 64;
};

// Collects VEIL_* assignments from a dotenv file. '#' comments, "export",
// quoted values and a UTF-8 BOM are accepted; keys without the VEIL_ prefix
// are ignored. A missing file yields an empty map.
std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path);

// Applies VEIL_* keys from env on top of cfg.
void ApplyEnvOverrides(Config& cfg, const std::unordered_map<std::string, std::string>& env);
void ApplyProcessEnv(Config& cfg);

// Accepts the settings flat or nested under a "veil" key.
void ApplyConfigJson(Config& cfg, const nlohmann::json& data);
Config LoadConfigFile(const std::string& path);

std::vector<std::string> SplitCsv(const std::string& s);
bool ParseBool(const std::string& s, bool def_val);

}  // namespace veil
