#include "veil/middleware.hpp"

#include <stdexcept>

#include "veil/analyzer_client.hpp"
#include "veil/sqlite_vault.hpp"

namespace veil {

RedactMiddleware::RedactMiddleware(std::shared_ptr<const RedactionPipeline> pipeline, std::unique_ptr<Vault> vault)
    : pipeline_(std::move(pipeline)), vault_(std::move(vault)) {
  if (!vault_) {
    throw std::invalid_argument("RedactMiddleware requires a vault");
  }
}

RedactMiddleware RedactMiddleware::Passthrough() {
  return RedactMiddleware(nullptr, std::make_unique<InMemoryVault>());
}

nlohmann::json RedactMiddleware::PreSend(const nlohmann::json& messages) {
  if (!pipeline_) {
    return messages;
  }
  return pipeline_->RedactMessages(messages, *vault_);
}

std::string RedactMiddleware::PostReceive(const std::string& text) const {
  if (!pipeline_) {
    return text;
  }
  return vault_->Rehydrate(text);
}

std::string RedactMiddleware::RedactText(const std::string& text) {
  if (!pipeline_) {
    return text;
  }
  return pipeline_->Redact(text, *vault_).text;
}

StreamingRehydrator RedactMiddleware::OpenStream(std::size_t max_token_bytes) const {
  return StreamingRehydrator(*vault_, max_token_bytes);
}

nlohmann::json RedactMiddleware::Stats() const {
  nlohmann::json stats;
  stats["vault_size"] = vault_->Size();
  stats["mappings"] = nlohmann::json::object();
  for (const auto& [token, original] : vault_->Dump()) {
    stats["mappings"][token] = original;
  }
  return stats;
}

RedactMiddleware MakeMiddleware(const Config& cfg, const std::string& session_id,
                                std::shared_ptr<RecognizerCache> recognizers) {
  if (!cfg.enabled) {
    return RedactMiddleware::Passthrough();
  }
  if (cfg.redactor.use_model && !recognizers) {
    AnalyzerClientOptions aopts;
    aopts.base_url = cfg.analyzer_url;
    aopts.read_timeout_sec = cfg.analyzer_timeout_sec;
    recognizers = MakeAnalyzerCache(std::move(aopts));
  }
  auto pipeline = std::make_shared<const RedactionPipeline>(cfg.redactor, std::move(recognizers));

  std::unique_ptr<Vault> vault;
  if (cfg.vault.backend == VaultBackend::kSqlite) {
    vault = std::make_unique<SqliteVault>(session_id, cfg.vault.path);
  } else {
    vault = std::make_unique<InMemoryVault>();
  }
  return RedactMiddleware(std::move(pipeline), std::move(vault));
}

}  // namespace veil
