#include "veil/resolver.hpp"

#include <algorithm>

namespace veil {

std::vector<EntityMatch> ResolveOverlaps(std::vector<EntityMatch> matches) {
  if (matches.size() < 2) {
    return matches;
  }

  std::stable_sort(matches.begin(), matches.end(), [](const EntityMatch& a, const EntityMatch& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.Length() > b.Length();
  });

  std::vector<EntityMatch> taken;
  taken.reserve(matches.size());
  for (auto& m : matches) {
    bool clash = std::any_of(taken.begin(), taken.end(),
                             [&](const EntityMatch& t) { return m.Overlaps(t.start, t.end); });
    if (!clash) {
      taken.push_back(std::move(m));
    }
  }

  std::stable_sort(taken.begin(), taken.end(),
                   [](const EntityMatch& a, const EntityMatch& b) { return a.start < b.start; });
  return taken;
}

bool MatchResolver::Accepts(const EntityMatch& m) const {
  if (filter_.skip_types.count(m.entity_type) != 0) {
    return false;
  }
  return filter_.allow_list.count(m.text) == 0;
}

std::vector<EntityMatch> MatchResolver::Resolve(std::vector<EntityMatch> matches) const {
  matches.erase(std::remove_if(matches.begin(), matches.end(),
                               [this](const EntityMatch& m) { return !Accepts(m); }),
                matches.end());
  return ResolveOverlaps(std::move(matches));
}

}  // namespace veil
