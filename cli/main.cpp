#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil/analyzer_client.hpp"
#include "veil/config.hpp"
#include "veil/errors.hpp"
#include "veil/pipeline.hpp"
#include "veil/record_reader.hpp"
#include "veil/session_registry.hpp"
#include "veil/sidecar.hpp"
#include "veil/sqlite_vault.hpp"
#include "veil/stream.hpp"

using namespace veil;

namespace {

struct Args {
  std::string config_path;
  std::string env_file = ".env";
  std::string session_id = "default";
  std::string command;
  std::vector<std::string> positional;
  // Flag overrides, applied after config file and environment.
  std::vector<std::pair<std::string, std::string>> overrides;
};

void PrintUsage() {
  std::cerr << "Usage:\n"
            << "  veil [options] <command> [args]\n\n"
            << "Commands:\n"
            << "  redact                  JSON message array on stdin -> redacted array on stdout\n"
            << "  redact-text             text on stdin -> JSON with redacted text and entities\n"
            << "  rehydrate               text on stdin -> rehydrated text\n"
            << "  rehydrate-stream        rehydrate stdin incrementally\n"
            << "  dump                    print the session's token mappings\n"
            << "  sessions                list sessions stored in the vault\n"
            << "  clear                   clear the session\n"
            << "  delete-session <id>     purge any session\n"
            << "  batch <in> <out>        redact a conversation log into JSON lines\n"
            << "  serve                   run the HTTP sidecar\n\n"
            << "Options:\n"
            << "  --config <file>  --env-file <file>  --db <path>  --session-id <id>\n"
            << "  --no-model  --language <code>  --threshold <score>\n"
            << "  --skip-types <a,b>  --allow-list <a,b>  --analyzer-url <url>\n";
}

bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](const char* flag) -> std::string {
      if (i + 1 >= argc) {
        throw ConfigError(std::string("missing value for ") + flag);
      }
      return argv[++i];
    };
    if (a == "--config") {
      args.config_path = value("--config");
    } else if (a == "--env-file") {
      args.env_file = value("--env-file");
    } else if (a == "--session-id") {
      args.session_id = value("--session-id");
    } else if (a == "--db") {
      args.overrides.emplace_back("VEIL_DB", value("--db"));
    } else if (a == "--no-model") {
      args.overrides.emplace_back("VEIL_NO_MODEL", "1");
    } else if (a == "--language") {
      args.overrides.emplace_back("VEIL_LANGUAGE", value("--language"));
    } else if (a == "--threshold") {
      args.overrides.emplace_back("VEIL_THRESHOLD", value("--threshold"));
    } else if (a == "--skip-types") {
      args.overrides.emplace_back("VEIL_SKIP_TYPES", value("--skip-types"));
    } else if (a == "--allow-list") {
      args.overrides.emplace_back("VEIL_ALLOW_LIST", value("--allow-list"));
    } else if (a == "--analyzer-url") {
      args.overrides.emplace_back("VEIL_ANALYZER_URL", value("--analyzer-url"));
    } else if (a == "-h" || a == "--help") {
      return false;
    } else if (!a.empty() && a[0] == '-' && args.command.empty()) {
      throw ConfigError("unknown option: " + a);
    } else if (args.command.empty()) {
      args.command = a;
    } else {
      args.positional.push_back(a);
    }
  }
  return !args.command.empty();
}

Config ResolveConfig(const Args& args) {
  Config cfg;
  if (!args.config_path.empty()) {
    cfg = LoadConfigFile(args.config_path);
  }
  ApplyEnvOverrides(cfg, ReadEnvFile(args.env_file));
  ApplyProcessEnv(cfg);
  std::unordered_map<std::string, std::string> flags(args.overrides.begin(), args.overrides.end());
  ApplyEnvOverrides(cfg, flags);
  return cfg;
}

std::shared_ptr<const RedactionPipeline> MakePipeline(const Config& cfg) {
  std::shared_ptr<RecognizerCache> recognizers;
  if (cfg.redactor.use_model) {
    AnalyzerClientOptions aopts;
    aopts.base_url = cfg.analyzer_url;
    aopts.read_timeout_sec = cfg.analyzer_timeout_sec;
    recognizers = MakeAnalyzerCache(std::move(aopts));
  }
  return std::make_shared<const RedactionPipeline>(cfg.redactor, std::move(recognizers));
}

std::string ReadAll(std::istream& in) {
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int RunRedact(const Config& cfg, SqliteVault& vault) {
  auto messages = nlohmann::json::parse(ReadAll(std::cin), nullptr, false);
  if (messages.is_discarded() || !messages.is_array()) {
    std::cerr << "redact: stdin must be a JSON array of messages\n";
    return 2;
  }
  std::cout << MakePipeline(cfg)->RedactMessages(messages, vault).dump(2) << "\n";
  return 0;
}

int RunRedactText(const Config& cfg, SqliteVault& vault) {
  auto result = MakePipeline(cfg)->Redact(ReadAll(std::cin), vault);
  nlohmann::json entities = nlohmann::json::array();
  for (const auto& m : result.entities) {
    entities.push_back({{"type", m.entity_type}, {"text", m.text}, {"score", m.score}, {"source", m.source}});
  }
  nlohmann::json out = {{"text", result.text}, {"entities", entities}, {"token_count", result.token_map.size()}};
  std::cout << out.dump(2) << "\n";
  return 0;
}

int RunRehydrateStream(const Config& cfg, const SqliteVault& vault) {
  StreamingRehydrator stream(vault, cfg.stream_max_token_bytes);
  char buf[256];
  while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount() > 0) {
    std::cout << stream.Feed(std::string_view(buf, static_cast<std::size_t>(std::cin.gcount()))) << std::flush;
  }
  std::cout << stream.Flush() << std::flush;
  return 0;
}

int RunServe(const Config& cfg) {
  SessionRegistry registry(cfg.vault);
  Sidecar sidecar(MakePipeline(cfg), registry);
  std::cerr << "veil sidecar on http://" << cfg.host << ":" << cfg.port << " (vault=" << VaultBackendName(cfg.vault.backend)
            << ", model=" << (cfg.redactor.use_model ? "on" : "off") << ")\n";
  if (!sidecar.Listen(cfg.host, cfg.port)) {
    std::cerr << "failed to bind " << cfg.host << ":" << cfg.port << "\n";
    return 3;
  }
  return 0;
}

int Run(const Args& args) {
  Config cfg = ResolveConfig(args);
  const std::string& cmd = args.command;

  if (cmd == "serve") {
    return RunServe(cfg);
  }

  SqliteVault vault(args.session_id, cfg.vault.path);

  if (cmd == "redact") return RunRedact(cfg, vault);
  if (cmd == "redact-text") return RunRedactText(cfg, vault);
  if (cmd == "rehydrate-stream") return RunRehydrateStream(cfg, vault);

  if (cmd == "rehydrate") {
    std::cout << vault.Rehydrate(ReadAll(std::cin));
    return 0;
  }
  if (cmd == "dump") {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [token, original] : vault.Dump()) {
      out[token] = original;
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }
  if (cmd == "sessions") {
    std::cout << nlohmann::json(vault.ListSessions()).dump(2) << "\n";
    return 0;
  }
  if (cmd == "clear") {
    vault.Clear();
    std::cerr << "cleared session " << args.session_id << "\n";
    return 0;
  }
  if (cmd == "delete-session") {
    if (args.positional.size() != 1) {
      PrintUsage();
      return 1;
    }
    vault.DeleteSession(args.positional[0]);
    std::cerr << "deleted session " << args.positional[0] << "\n";
    return 0;
  }
  if (cmd == "batch") {
    if (args.positional.size() != 2) {
      PrintUsage();
      return 1;
    }
    auto stats = RedactFile(*MakePipeline(cfg), vault, args.positional[0], args.positional[1]);
    std::cerr << args.positional[0] << ": records=" << stats.records << " skipped=" << stats.skipped
              << " vault_size=" << vault.Size() << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  PrintUsage();
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  try {
    if (!ParseArgs(argc, argv, args)) {
      PrintUsage();
      return 1;
    }
    return Run(args);
  } catch (const ConfigError& e) {
    std::cerr << "config error: " << e.what() << "\n";
    return 2;
  } catch (const StorageError& e) {
    std::cerr << "vault error: " << e.what() << "\n";
    return 4;
  } catch (const ScanError& e) {
    std::cerr << "scan error: " << e.what() << "\n";
    return 5;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
