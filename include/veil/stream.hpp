#pragma once

#include <string>
#include <string_view>

#include "veil/vault.hpp"

namespace veil {

// Rehydrates text that arrives in arbitrary chunks. A token split across
// chunks is held back until it is complete; anything that cannot become a
// token is released as soon as that is known.
class StreamingRehydrator {
 public:
  explicit StreamingRehydrator(const Vault& vault, std::size_t max_token_bytes = 64)
      : vault_(vault), max_token_bytes_(max_token_bytes) {}

  [[nodiscard]] std::string Feed(std::string_view chunk);
  [[nodiscard]] std::string Flush();

  [[nodiscard]] std::size_t Pending() const { return buffer_.size(); }

 private:
  void Drain(std::string& out);

  const Vault& vault_;
  std::string buffer_;
  std::size_t max_token_bytes_;
};

// True for «TYPE_NNN» with TYPE in [A-Z_]+ and at least three digits.
[[nodiscard]] bool LooksLikeToken(std::string_view text);

}  // namespace veil
