#include "veil/model_scanner.hpp"

#include <algorithm>

#include "veil/errors.hpp"

namespace veil {

std::shared_ptr<EntityRecognizer> RecognizerCache::Get(const std::string& language) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = engines_.find(language);
  if (it != engines_.end()) {
    return it->second;
  }
  auto engine = factory_(language);
  if (!engine) {
    throw ScanError("no entity recognizer available for language '" + language + "'");
  }
  engines_.emplace(language, engine);
  return engine;
}

void RecognizerCache::Reset() {
  std::lock_guard<std::mutex> lock(mu_);
  engines_.clear();
}

std::size_t RecognizerCache::Loaded() const {
  std::lock_guard<std::mutex> lock(mu_);
  return engines_.size();
}

const std::vector<std::string>& DefaultModelEntities() {
  static const std::vector<std::string> kEntities = {
      "PERSON", "ORGANIZATION", "LOCATION", "NRP", "MEDICAL_LICENSE", "URL", "DATE_TIME",
  };
  return kEntities;
}

ModelScanner::ModelScanner(std::shared_ptr<RecognizerCache> recognizers, ModelScanOptions options)
    : recognizers_(std::move(recognizers)), options_(std::move(options)) {
  if (!recognizers_) {
    throw std::invalid_argument("ModelScanner requires a recognizer cache");
  }
}

std::vector<EntityMatch> ModelScanner::Scan(std::string_view text, const std::vector<Span>& exclude_spans) const {
  auto engine = recognizers_->Get(options_.language);
  const auto& entities = options_.entities.empty() ? DefaultModelEntities() : options_.entities;
  auto found = engine->Analyze(text, options_.language, entities, options_.score_threshold);

  std::vector<EntityMatch> matches;
  matches.reserve(found.size());
  for (const auto& r : found) {
    if (r.score < options_.score_threshold) {
      continue;
    }
    if (r.start >= r.end || r.end > text.size()) {
      continue;
    }
    bool excluded = std::any_of(exclude_spans.begin(), exclude_spans.end(),
                                [&](const Span& s) { return r.start < s.second && r.end > s.first; });
    if (excluded) {
      continue;
    }
    matches.push_back(EntityMatch{r.entity_type, r.start, r.end,
                                  std::string(text.substr(r.start, r.end - r.start)), r.score, "model"});
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const EntityMatch& a, const EntityMatch& b) { return a.start < b.start; });
  return matches;
}

}  // namespace veil
