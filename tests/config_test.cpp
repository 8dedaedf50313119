#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "veil/config.hpp"
#include "veil/errors.hpp"

int main() {
  using namespace veil;

  const auto dir = std::filesystem::temp_directory_path() / "veil_config_test";
  std::filesystem::create_directories(dir);

  {
    Config cfg;
    assert(cfg.enabled);
    assert(cfg.redactor.use_model);
    assert(cfg.redactor.language == "en");
    assert(cfg.redactor.score_threshold == 0.35);
    assert(cfg.port == 18791);
    assert(cfg.host == "127.0.0.1");
    assert(cfg.vault.backend == VaultBackend::kSqlite);
    assert(cfg.stream_max_token_bytes == 64);
  }

  {
    auto parts = SplitCsv(" EMAIL, PHONE ,,SSN ");
    assert(parts.size() == 3);
    assert(parts[0] == "EMAIL" && parts[1] == "PHONE" && parts[2] == "SSN");
    assert(SplitCsv("").empty());
    assert(ParseBool("Yes", false));
    assert(!ParseBool("off", true));
    assert(ParseBool("maybe", true));
  }

  {
    const auto env_path = dir / "test.env";
    {
      std::ofstream out(env_path, std::ios::binary);
      out << "\xEF\xBB\xBF# comment\r\n"
          << "VEIL_DB = \"/tmp/veil/x.db\"\n"
          << "export VEIL_PORT=9000\n"
          << "VEIL_NO_MODEL=true\n"
          << "VEIL_SKIP_TYPES='DATE_TIME, URL'\n"
          << "not a pair\n"
          << "PATH=/usr/bin\n"
          << "VEIL_MAX_SESSIONS=8 # per process\n"
          << "VEIL_LANGUAGE=\"de\" # quoted\n"
          << "VEIL_THRESHOLD=abc\n";
    }
    auto env = ReadEnvFile(env_path.string());
    assert(env.at("VEIL_DB") == "/tmp/veil/x.db");
    assert(env.at("VEIL_PORT") == "9000");
    assert(env.at("VEIL_SKIP_TYPES") == "DATE_TIME, URL");
    assert(env.count("not a pair") == 0);
    assert(env.count("PATH") == 0);
    assert(env.at("VEIL_MAX_SESSIONS") == "8");
    assert(env.at("VEIL_LANGUAGE") == "de");
    assert(env.size() == 7);

    Config cfg;
    ApplyEnvOverrides(cfg, env);
    assert(cfg.vault.path == "/tmp/veil/x.db");
    assert(cfg.port == 9000);
    assert(!cfg.redactor.use_model);
    assert(cfg.redactor.skip_types.size() == 2);
    assert(cfg.redactor.skip_types[1] == "URL");
    assert(cfg.vault.max_open_sessions == 8);
    assert(cfg.redactor.language == "de");
    // Unparseable numbers keep the previous value.
    assert(cfg.redactor.score_threshold == 0.35);

    assert(ReadEnvFile((dir / "missing.env").string()).empty());
  }

  {
    auto data = nlohmann::json::parse(R"({
      "veil": {
        "enabled": true,
        "use_model": false,
        "language": "de",
        "score_threshold": 0.5,
        "entities": ["PERSON"],
        "allow_list": ["ok@example.com"],
        "analyzer": {"url": "http://analyzer:3000", "timeout": 3},
        "vault": {"backend": "memory", "path": "v.db"},
        "server": {"host": "0.0.0.0", "port": 8080}
      }
    })");
    Config cfg;
    ApplyConfigJson(cfg, data);
    assert(!cfg.redactor.use_model);
    assert(cfg.redactor.language == "de");
    assert(cfg.redactor.score_threshold == 0.5);
    assert(cfg.redactor.model_entities.size() == 1);
    assert(cfg.redactor.allow_list[0] == "ok@example.com");
    assert(cfg.analyzer_url == "http://analyzer:3000");
    assert(cfg.analyzer_timeout_sec == 3);
    assert(cfg.vault.backend == VaultBackend::kMemory);
    assert(cfg.vault.path == "v.db");
    assert(cfg.host == "0.0.0.0" && cfg.port == 8080);

    // Later layers win.
    ApplyEnvOverrides(cfg, {{"VEIL_PORT", "7000"}, {"VEIL_VAULT_BACKEND", "sqlite"}});
    assert(cfg.port == 7000);
    assert(cfg.vault.backend == VaultBackend::kSqlite);
  }

  {
    Config cfg;
    ApplyConfigJson(cfg, nlohmann::json::parse(R"({"enabled": false, "skip_types": "URL,EMAIL"})"));
    assert(!cfg.enabled);
    assert(cfg.redactor.skip_types.size() == 2);
  }

  {
    const auto path = dir / "veil.json";
    {
      std::ofstream out(path);
      out << R"({"language": "fr", "vault": {"path": "~/x.db"}})";
    }
    auto cfg = LoadConfigFile(path.string());
    assert(cfg.redactor.language == "fr");
    assert(cfg.vault.path == "~/x.db");
  }

  auto throws_config_error = [](auto&& fn) {
    try {
      fn();
    } catch (const ConfigError&) {
      return true;
    }
    return false;
  };

  assert(throws_config_error([&] { (void)LoadConfigFile((dir / "nope.json").string()); }));
  {
    const auto bad = dir / "bad.json";
    std::ofstream(bad) << "{ not json";
    assert(throws_config_error([&] { (void)LoadConfigFile(bad.string()); }));
  }
  assert(throws_config_error([] {
    Config cfg;
    ApplyConfigJson(cfg, nlohmann::json::parse(R"({"vault": {"backend": "redis"}})"));
  }));
  assert(throws_config_error([] {
    Config cfg;
    ApplyConfigJson(cfg, nlohmann::json::parse(R"({"score_threshold": "high"})"));
  }));
  assert(throws_config_error([] {
    Config cfg;
    ApplyConfigJson(cfg, nlohmann::json::array());
  }));

  std::filesystem::remove_all(dir);
  return 0;
}
