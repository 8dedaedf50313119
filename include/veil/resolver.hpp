#pragma once

#include <set>
#include <string>
#include <vector>

#include "veil/entity.hpp"

namespace veil {

struct MatchFilter {
  std::set<std::string> skip_types;
  std::set<std::string> allow_list;
};

// Greedy interval selection: ranks by score, then span length (both
// descending, stable with respect to input order), keeps every match that does
// not intersect an already kept one, and returns the survivors by start.
[[nodiscard]] std::vector<EntityMatch> ResolveOverlaps(std::vector<EntityMatch> matches);

class MatchResolver {
 public:
  explicit MatchResolver(MatchFilter filter = {}) : filter_(std::move(filter)) {}

  [[nodiscard]] std::vector<EntityMatch> Resolve(std::vector<EntityMatch> matches) const;
  [[nodiscard]] bool Accepts(const EntityMatch& m) const;

  [[nodiscard]] const MatchFilter& Filter() const { return filter_; }

 private:
  MatchFilter filter_;
};

}  // namespace veil
