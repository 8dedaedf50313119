#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "veil/entity.hpp"
#include "veil/scanner.hpp"

namespace veil {

// Raw recognizer output; offsets are UTF-8 byte offsets into the analyzed text.
struct RecognizedEntity {
  std::string entity_type;
  std::size_t start = 0;
  std::size_t end = 0;
  double score = 0.0;
};

// A named-entity recognition engine bound to one language.
class EntityRecognizer {
 public:
  virtual ~EntityRecognizer() = default;

  [[nodiscard]] virtual std::vector<RecognizedEntity> Analyze(std::string_view text,
                                                              const std::string& language,
                                                              const std::vector<std::string>& entities,
                                                              double score_threshold) const = 0;
};

// Builds recognizers lazily, at most once per language until Reset().
class RecognizerCache {
 public:
  using Factory = std::function<std::shared_ptr<EntityRecognizer>(const std::string& language)>;

  explicit RecognizerCache(Factory factory) : factory_(std::move(factory)) {}

  [[nodiscard]] std::shared_ptr<EntityRecognizer> Get(const std::string& language);
  void Reset();
  [[nodiscard]] std::size_t Loaded() const;

 private:
  Factory factory_;
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<EntityRecognizer>> engines_;
};

const std::vector<std::string>& DefaultModelEntities();

struct ModelScanOptions {
  std::string language = "en";
  std::vector<std::string> entities;  // empty selects DefaultModelEntities()
  double score_threshold = 0.35;
};

class ModelScanner final : public EntityScanner {
 public:
  ModelScanner(std::shared_ptr<RecognizerCache> recognizers, ModelScanOptions options = {});

  // Matches at or above the threshold that do not intersect any excluded span,
  // ascending by start.
  [[nodiscard]] std::vector<EntityMatch> Scan(std::string_view text, const std::vector<Span>& exclude_spans) const;

  [[nodiscard]] std::vector<EntityMatch> Scan(std::string_view text) const override { return Scan(text, {}); }
  [[nodiscard]] std::string_view Name() const override { return "model"; }

  [[nodiscard]] const ModelScanOptions& Options() const { return options_; }

 private:
  std::shared_ptr<RecognizerCache> recognizers_;
  ModelScanOptions options_;
};

}  // namespace veil
