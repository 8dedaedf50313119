#include "veil/vault.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace veil {

namespace {

void ReplaceAll(std::string& text, std::string_view from, std::string_view to) {
  std::string out;
  std::size_t pos = 0;
  std::size_t hit = text.find(from);
  if (hit == std::string::npos) {
    return;
  }
  out.reserve(text.size());
  while (hit != std::string::npos) {
    out.append(text, pos, hit - pos);
    out.append(to);
    pos = hit + from.size();
    hit = text.find(from, pos);
  }
  out.append(text, pos, std::string::npos);
  text.swap(out);
}

}  // namespace

std::string FormatToken(std::string_view entity_type, std::uint64_t ordinal) {
  std::ostringstream oss;
  oss << kTokenOpen << entity_type << '_' << std::setw(3) << std::setfill('0') << ordinal << kTokenClose;
  return oss.str();
}

bool IsEntityType(std::string_view entity_type) {
  return !entity_type.empty() && std::all_of(entity_type.begin(), entity_type.end(),
                                             [](char c) { return (c >= 'A' && c <= 'Z') || c == '_'; });
}

std::string NormalizeEntityType(std::string_view entity_type) {
  std::string out(entity_type);
  for (char& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    } else if (c < 'A' || c > 'Z') {
      c = '_';
    }
  }
  return out;
}

const std::string* TokenTable::FindToken(const std::string& entity_type, const std::string& original) const {
  auto it = pii_to_token_.find({entity_type, original});
  return it == pii_to_token_.end() ? nullptr : &it->second;
}

const std::string* TokenTable::FindOriginal(std::string_view token) const {
  auto it = token_to_pii_.find(token);
  return it == token_to_pii_.end() ? nullptr : &it->second;
}

std::uint64_t TokenTable::Counter(const std::string& entity_type) const {
  auto it = counters_.find(entity_type);
  return it == counters_.end() ? 0 : it->second;
}

void TokenTable::SetCounter(const std::string& entity_type, std::uint64_t value) {
  auto& slot = counters_[entity_type];
  slot = std::max(slot, value);
}

void TokenTable::Insert(const std::string& entity_type, const std::string& original, const std::string& token) {
  pii_to_token_[{entity_type, original}] = token;
  token_to_pii_[token] = original;
  longest_ = std::max(longest_, token.size());
}

std::string TokenTable::Rehydrate(std::string_view text) const {
  std::string result(text);
  if (token_to_pii_.empty() || result.find(kTokenOpen) == std::string::npos) {
    return result;
  }

  // Longest first so a shorter token never eats the head of a longer one.
  std::vector<const std::pair<const std::string, std::string>*> order;
  order.reserve(token_to_pii_.size());
  for (const auto& kv : token_to_pii_) {
    order.push_back(&kv);
  }
  std::stable_sort(order.begin(), order.end(),
                   [](const auto* a, const auto* b) { return a->first.size() > b->first.size(); });

  for (const auto* kv : order) {
    ReplaceAll(result, kv->first, kv->second);
  }
  return result;
}

void TokenTable::Clear() {
  pii_to_token_.clear();
  token_to_pii_.clear();
  counters_.clear();
  longest_ = 0;
}

std::string InMemoryVault::GetOrCreateToken(const std::string& entity_type, const std::string& original) {
  if (!IsEntityType(entity_type)) {
    throw std::invalid_argument("invalid entity type '" + entity_type + "'");
  }
  if (const auto* existing = table_.FindToken(entity_type, original)) {
    return *existing;
  }
  const std::uint64_t ordinal = table_.Counter(entity_type) + 1;
  std::string token = FormatToken(entity_type, ordinal);
  table_.SetCounter(entity_type, ordinal);
  table_.Insert(entity_type, original, token);
  return token;
}

std::optional<std::string> InMemoryVault::LookupToken(std::string_view token) const {
  if (const auto* original = table_.FindOriginal(token)) {
    return *original;
  }
  return std::nullopt;
}

std::optional<std::string> InMemoryVault::LookupPii(const std::string& entity_type,
                                                    const std::string& original) const {
  if (const auto* token = table_.FindToken(entity_type, original)) {
    return *token;
  }
  return std::nullopt;
}

std::map<std::string, std::string> InMemoryVault::Dump() const {
  return {table_.Tokens().begin(), table_.Tokens().end()};
}

}  // namespace veil
