#include "veil/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string_view>
#include <utility>

#include "veil/errors.hpp"

namespace veil {

namespace {

constexpr const char* kEnvKeys[] = {
    "VEIL_DB",        "VEIL_VAULT_BACKEND", "VEIL_HOST",         "VEIL_PORT",       "VEIL_NO_MODEL",
    "VEIL_LANGUAGE",  "VEIL_THRESHOLD",     "VEIL_ANALYZER_URL", "VEIL_SKIP_TYPES", "VEIL_ALLOW_LIST",
    "VEIL_MAX_SESSIONS",
};

std::string Trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

int ParseInt(const std::string& s, int def_val) {
  try {
    return std::stoi(s);
  } catch (const std::exception&) {
    return def_val;
  }
}

double ParseDouble(const std::string& s, double def_val) {
  try {
    return std::stod(s);
  } catch (const std::exception&) {
    return def_val;
  }
}

std::vector<std::string> StringList(const nlohmann::json& v, const char* key) {
  if (v.is_string()) {
    return SplitCsv(v.get<std::string>());
  }
  if (!v.is_array()) {
    throw ConfigError(std::string("config key '") + key + "' must be a list of strings");
  }
  std::vector<std::string> out;
  for (const auto& item : v) {
    if (!item.is_string()) {
      throw ConfigError(std::string("config key '") + key + "' must be a list of strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kEnvPrefix = "VEIL_";

// One "[export ]VEIL_KEY=value" line. Quoted values are taken verbatim; an
// unquoted value ends at " #". Lines for other programs yield nothing.
std::optional<std::pair<std::string, std::string>> ParseEnvLine(const std::string& raw) {
  const std::string line = Trim(raw);
  if (line.empty() || line[0] == '#') {
    return std::nullopt;
  }
  const auto eq = line.find('=');
  if (eq == std::string::npos) {
    return std::nullopt;
  }
  std::string key = Trim(line.substr(0, eq));
  if (key.rfind("export ", 0) == 0) {
    key = Trim(key.substr(7));
  }
  if (key.rfind(kEnvPrefix, 0) != 0) {
    return std::nullopt;
  }

  std::string val = Trim(line.substr(eq + 1));
  if (!val.empty() && (val.front() == '"' || val.front() == '\'')) {
    const auto close = val.find(val.front(), 1);
    if (close != std::string::npos) {
      return std::make_pair(std::move(key), val.substr(1, close - 1));
    }
  }
  const auto comment = val.find(" #");
  if (comment != std::string::npos) {
    val = Trim(val.substr(0, comment));
  }
  return std::make_pair(std::move(key), std::move(val));
}

}  // namespace

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(Trim(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty() || !out.empty()) {
    out.push_back(Trim(cur));
  }
  out.erase(std::remove_if(out.begin(), out.end(), [](const std::string& v) { return v.empty(); }), out.end());
  return out;
}

bool ParseBool(const std::string& s, bool def_val) {
  std::string v;
  v.reserve(s.size());
  for (char c : s) {
    v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    return false;
  }
  return def_val;
}

std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path) {
  std::unordered_map<std::string, std::string> env;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return env;
  }
  std::string line;
  for (std::size_t lineno = 0; std::getline(in, line); ++lineno) {
    if (lineno == 0 && line.rfind(kUtf8Bom, 0) == 0) {
      line.erase(0, kUtf8Bom.size());
    }
    if (auto kv = ParseEnvLine(line)) {
      env[kv->first] = std::move(kv->second);
    }
  }
  return env;
}

void ApplyEnvOverrides(Config& cfg, const std::unordered_map<std::string, std::string>& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    if (it == env.end()) {
      return nullptr;
    }
    return &it->second;
  };
  if (auto v = get("VEIL_DB"))
    cfg.vault.path = *v;
  if (auto v = get("VEIL_VAULT_BACKEND"))
    cfg.vault.backend = ParseVaultBackend(*v);
  if (auto v = get("VEIL_MAX_SESSIONS"))
    cfg.vault.max_open_sessions = static_cast<std::size_t>(
        std::max(0, ParseInt(*v, static_cast<int>(cfg.vault.max_open_sessions))));
  if (auto v = get("VEIL_HOST"))
    cfg.host = *v;
  if (auto v = get("VEIL_PORT"))
    cfg.port = ParseInt(*v, cfg.port);
  if (auto v = get("VEIL_NO_MODEL"))
    cfg.redactor.use_model = !ParseBool(*v, !cfg.redactor.use_model);
  if (auto v = get("VEIL_LANGUAGE"))
    cfg.redactor.language = *v;
  if (auto v = get("VEIL_THRESHOLD"))
    cfg.redactor.score_threshold = ParseDouble(*v, cfg.redactor.score_threshold);
  if (auto v = get("VEIL_ANALYZER_URL"))
    cfg.analyzer_url = *v;
  if (auto v = get("VEIL_SKIP_TYPES"))
    cfg.redactor.skip_types = SplitCsv(*v);
  if (auto v = get("VEIL_ALLOW_LIST"))
    cfg.redactor.allow_list = SplitCsv(*v);
}

void ApplyProcessEnv(Config& cfg) {
  std::unordered_map<std::string, std::string> env;
  for (const char* key : kEnvKeys) {
    if (const char* value = std::getenv(key)) {
      env[key] = value;
    }
  }
  ApplyEnvOverrides(cfg, env);
}

void ApplyConfigJson(Config& cfg, const nlohmann::json& root) {
  if (!root.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }
  const nlohmann::json& data = root.contains("veil") ? root.at("veil") : root;
  if (!data.is_object()) {
    throw ConfigError("config key 'veil' must be an object");
  }

  try {
    if (data.contains("enabled"))
      cfg.enabled = data.at("enabled").get<bool>();
    if (data.contains("use_model"))
      cfg.redactor.use_model = data.at("use_model").get<bool>();
    if (data.contains("language"))
      cfg.redactor.language = data.at("language").get<std::string>();
    if (data.contains("score_threshold"))
      cfg.redactor.score_threshold = data.at("score_threshold").get<double>();
    if (data.contains("entities") && !data.at("entities").is_null())
      cfg.redactor.model_entities = StringList(data.at("entities"), "entities");
    if (data.contains("skip_types"))
      cfg.redactor.skip_types = StringList(data.at("skip_types"), "skip_types");
    if (data.contains("allow_list"))
      cfg.redactor.allow_list = StringList(data.at("allow_list"), "allow_list");
    if (data.contains("stream_max_token_bytes"))
      cfg.stream_max_token_bytes = data.at("stream_max_token_bytes").get<std::size_t>();

    if (data.contains("analyzer")) {
      const auto& a = data.at("analyzer");
      if (a.contains("url"))
        cfg.analyzer_url = a.at("url").get<std::string>();
      if (a.contains("timeout"))
        cfg.analyzer_timeout_sec = a.at("timeout").get<int>();
    }
    if (data.contains("vault")) {
      const auto& v = data.at("vault");
      if (v.contains("backend"))
        cfg.vault.backend = ParseVaultBackend(v.at("backend").get<std::string>());
      if (v.contains("path"))
        cfg.vault.path = v.at("path").get<std::string>();
      if (v.contains("max_open_sessions"))
        cfg.vault.max_open_sessions = v.at("max_open_sessions").get<std::size_t>();
    }
    if (data.contains("server")) {
      const auto& s = data.at("server");
      if (s.contains("host"))
        cfg.host = s.at("host").get<std::string>();
      if (s.contains("port"))
        cfg.port = s.at("port").get<int>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
}

Config LoadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }
  auto data = nlohmann::json::parse(in, nullptr, false);
  if (data.is_discarded()) {
    throw ConfigError("config file is not valid JSON: " + path);
  }
  Config cfg;
  ApplyConfigJson(cfg, data);
  return cfg;
}

}  // namespace veil
