#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace veil {

// Half-open byte range [first, second) into a UTF-8 string.
using Span = std::pair<std::size_t, std::size_t>;

struct EntityMatch {
  std::string entity_type;
  std::size_t start = 0;
  std::size_t end = 0;
  std::string text;
  double score = 0.0;
  std::string source;

  [[nodiscard]] std::size_t Length() const { return end - start; }
  [[nodiscard]] bool Overlaps(std::size_t s, std::size_t e) const { return start < e && end > s; }
};

struct RedactedMessage {
  std::string text;
  std::vector<EntityMatch> entities;
  std::map<std::string, std::string> token_map;
};

}  // namespace veil
