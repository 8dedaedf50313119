#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil/entity.hpp"
#include "veil/model_scanner.hpp"
#include "veil/resolver.hpp"
#include "veil/scanner.hpp"
#include "veil/vault.hpp"

namespace veil {

struct RedactorOptions {
  bool use_model = true;
  std::string language = "en";
  double score_threshold = 0.35;
  std::vector<std::string> model_entities;  // empty selects DefaultModelEntities()
  std::vector<std::string> skip_types;
  std::vector<std::string> allow_list;
};

// Structured scan, model scan outside structured spans, custom scanners, then
// overlap resolution and token substitution against a session vault.
class RedactionPipeline {
 public:
  explicit RedactionPipeline(RedactorOptions options = {}, std::shared_ptr<RecognizerCache> recognizers = nullptr);

  void AddScanner(std::shared_ptr<EntityScanner> scanner);

  [[nodiscard]] RedactedMessage Redact(std::string_view text, Vault& vault) const;

  // Returns a copy of messages with every non-empty string content_key field
  // redacted; everything else is copied as is.
  [[nodiscard]] nlohmann::json RedactMessages(const nlohmann::json& messages, Vault& vault,
                                              const std::string& content_key = "content") const;

  [[nodiscard]] std::vector<EntityMatch> Detect(std::string_view text) const;

  [[nodiscard]] const RedactorOptions& Options() const { return options_; }

 private:
  RedactorOptions options_;
  StructuredScanner structured_;
  std::unique_ptr<ModelScanner> model_;
  std::vector<std::shared_ptr<EntityScanner>> custom_;
  MatchResolver resolver_;
};

}  // namespace veil
