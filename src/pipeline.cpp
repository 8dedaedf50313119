#include "veil/pipeline.hpp"

#include <algorithm>

#include "veil/errors.hpp"

namespace veil {

namespace {

MatchFilter MakeFilter(const RedactorOptions& options) {
  MatchFilter filter;
  filter.skip_types.insert(options.skip_types.begin(), options.skip_types.end());
  filter.allow_list.insert(options.allow_list.begin(), options.allow_list.end());
  return filter;
}

template <typename Fn>
std::vector<EntityMatch> Guarded(std::string_view name, Fn&& fn) {
  try {
    return fn();
  } catch (const ScanError&) {
    throw;
  } catch (const std::exception& e) {
    throw ScanError("scanner '" + std::string(name) + "' failed: " + e.what());
  }
}

}  // namespace

RedactionPipeline::RedactionPipeline(RedactorOptions options, std::shared_ptr<RecognizerCache> recognizers)
    : options_(std::move(options)), resolver_(MakeFilter(options_)) {
  if (options_.use_model) {
    if (!recognizers) {
      throw std::invalid_argument("use_model requires a recognizer cache");
    }
    ModelScanOptions mopts;
    mopts.language = options_.language;
    mopts.entities = options_.model_entities;
    mopts.score_threshold = options_.score_threshold;
    model_ = std::make_unique<ModelScanner>(std::move(recognizers), std::move(mopts));
  }
}

void RedactionPipeline::AddScanner(std::shared_ptr<EntityScanner> scanner) {
  if (!scanner) {
    throw std::invalid_argument("AddScanner: null scanner");
  }
  custom_.push_back(std::move(scanner));
}

std::vector<EntityMatch> RedactionPipeline::Detect(std::string_view text) const {
  std::vector<EntityMatch> all = Guarded(structured_.Name(), [&] { return structured_.Scan(text); });

  if (model_) {
    std::vector<Span> exclude;
    exclude.reserve(all.size());
    for (const auto& m : all) {
      exclude.emplace_back(m.start, m.end);
    }
    auto found = Guarded(model_->Name(), [&] { return model_->Scan(text, exclude); });
    for (auto& m : found) {
      m.entity_type = NormalizeEntityType(m.entity_type);
    }
    all.insert(all.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  }

  for (const auto& scanner : custom_) {
    auto found = Guarded(scanner->Name(), [&] { return scanner->Scan(text); });
    for (auto& m : found) {
      // Out-of-range spans and untyped matches from user scanners cannot be substituted.
      if (m.start < m.end && m.end <= text.size() && !m.entity_type.empty()) {
        m.entity_type = NormalizeEntityType(m.entity_type);
        all.push_back(std::move(m));
      }
    }
  }

  return resolver_.Resolve(std::move(all));
}

RedactedMessage RedactionPipeline::Redact(std::string_view text, Vault& vault) const {
  RedactedMessage out;
  if (text.empty()) {
    return out;
  }

  out.entities = Detect(text);

  std::vector<std::string> tokens(out.entities.size());
  for (std::size_t i = out.entities.size(); i-- > 0;) {
    const auto& m = out.entities[i];
    tokens[i] = vault.GetOrCreateToken(m.entity_type, m.text);
    out.token_map[tokens[i]] = m.text;
  }

  // Entities are disjoint and ascending, so one forward pass rebuilds the text.
  out.text.reserve(text.size());
  std::size_t pos = 0;
  for (std::size_t i = 0; i < out.entities.size(); ++i) {
    const auto& m = out.entities[i];
    out.text.append(text.substr(pos, m.start - pos));
    out.text.append(tokens[i]);
    pos = m.end;
  }
  out.text.append(text.substr(pos));
  return out;
}

nlohmann::json RedactionPipeline::RedactMessages(const nlohmann::json& messages, Vault& vault,
                                                 const std::string& content_key) const {
  if (!messages.is_array()) {
    throw std::invalid_argument("RedactMessages expects a JSON array");
  }
  nlohmann::json out = nlohmann::json::array();
  for (const auto& msg : messages) {
    nlohmann::json copy = msg;
    if (copy.is_object()) {
      auto it = copy.find(content_key);
      if (it != copy.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
        *it = Redact(it->get_ref<const std::string&>(), vault).text;
      }
    }
    out.push_back(std::move(copy));
  }
  return out;
}

}  // namespace veil
