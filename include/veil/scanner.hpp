#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "veil/entity.hpp"

namespace re2 {
class RE2;
}  // namespace re2

namespace veil {

class EntityScanner {
 public:
  virtual ~EntityScanner() = default;

  [[nodiscard]] virtual std::vector<EntityMatch> Scan(std::string_view text) const = 0;
  [[nodiscard]] virtual std::string_view Name() const = 0;
};

// Adapts a user callable into a scanner. Matches keep whatever source the
// callable assigns; an empty source is replaced by the scanner name.
class FunctionScanner final : public EntityScanner {
 public:
  using ScanFn = std::function<std::vector<EntityMatch>(std::string_view)>;

  FunctionScanner(std::string name, ScanFn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

  [[nodiscard]] std::vector<EntityMatch> Scan(std::string_view text) const override;
  [[nodiscard]] std::string_view Name() const override { return name_; }

 private:
  std::string name_;
  ScanFn fn_;
};

// Patterns are compiled for RE2 in Latin-1 mode so offsets are byte offsets.
// RE2 has no lookaround; the two digit guards stand in for (?<!\d) and (?!\d).
struct StructuredPattern {
  std::string entity_type;
  std::shared_ptr<const re2::RE2> pattern;
  double score = 0.0;
  bool reject_after_digit = false;
  bool reject_before_digit = false;
};

class StructuredScanner final : public EntityScanner {
 public:
  StructuredScanner();

  [[nodiscard]] std::vector<EntityMatch> Scan(std::string_view text) const override;
  [[nodiscard]] std::string_view Name() const override { return "structured"; }

  [[nodiscard]] const std::vector<StructuredPattern>& Patterns() const { return patterns_; }

 private:
  void ScanPattern(const StructuredPattern& p, std::string_view text,
                   std::vector<EntityMatch>& out) const;

  std::vector<StructuredPattern> patterns_;
};

}  // namespace veil
