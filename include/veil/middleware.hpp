#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "veil/config.hpp"
#include "veil/pipeline.hpp"
#include "veil/stream.hpp"
#include "veil/vault.hpp"

namespace veil {

// Sits between a chat client and the model provider: redacts outbound
// messages and restores tokens in replies, all against one session vault.
class RedactMiddleware {
 public:
  RedactMiddleware(std::shared_ptr<const RedactionPipeline> pipeline, std::unique_ptr<Vault> vault);

  // Redacts nothing and rehydrates nothing.
  static RedactMiddleware Passthrough();

  [[nodiscard]] nlohmann::json PreSend(const nlohmann::json& messages);
  [[nodiscard]] std::string PostReceive(const std::string& text) const;
  [[nodiscard]] std::string RedactText(const std::string& text);
  [[nodiscard]] std::string RehydrateText(const std::string& text) const { return PostReceive(text); }

  // The stream borrows this middleware's vault and must not outlive it.
  [[nodiscard]] StreamingRehydrator OpenStream(std::size_t max_token_bytes = 64) const;

  [[nodiscard]] nlohmann::json Stats() const;

  [[nodiscard]] bool Enabled() const { return pipeline_ != nullptr; }
  [[nodiscard]] Vault& SessionVault() { return *vault_; }

 private:
  std::shared_ptr<const RedactionPipeline> pipeline_;
  std::unique_ptr<Vault> vault_;
};

// Builds a middleware for session_id from cfg. When the model layer is on and
// no recognizers are given, they are served by the configured analyzer URL.
[[nodiscard]] RedactMiddleware MakeMiddleware(const Config& cfg, const std::string& session_id = "default",
                                              std::shared_ptr<RecognizerCache> recognizers = nullptr);

}  // namespace veil
