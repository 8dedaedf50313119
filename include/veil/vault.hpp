#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace veil {

// UTF-8 encodings of U+00AB and U+00BB.
inline constexpr std::string_view kTokenOpen = "\xC2\xAB";
inline constexpr std::string_view kTokenClose = "\xC2\xBB";

// «TYPE_NNN», ordinal zero padded to at least three digits.
[[nodiscard]] std::string FormatToken(std::string_view entity_type, std::uint64_t ordinal);

// Token types are non-empty runs of [A-Z_].
[[nodiscard]] bool IsEntityType(std::string_view entity_type);
// Upper-cases letters and maps every other byte outside [A-Z_] to '_'.
[[nodiscard]] std::string NormalizeEntityType(std::string_view entity_type);

class Vault {
 public:
  virtual ~Vault() = default;

  // Returns the session's token for (entity_type, original), issuing the next
  // ordinal for entity_type on first sight. Throws std::invalid_argument when
  // entity_type is not a token type.
  virtual std::string GetOrCreateToken(const std::string& entity_type, const std::string& original) = 0;

  [[nodiscard]] virtual std::string Rehydrate(std::string_view text) const = 0;
  [[nodiscard]] virtual std::optional<std::string> LookupToken(std::string_view token) const = 0;
  [[nodiscard]] virtual std::optional<std::string> LookupPii(const std::string& entity_type,
                                                             const std::string& original) const = 0;

  [[nodiscard]] virtual std::size_t Size() const = 0;
  // Byte length of the longest token issued so far, 0 when empty.
  [[nodiscard]] virtual std::size_t LongestToken() const = 0;
  [[nodiscard]] virtual std::map<std::string, std::string> Dump() const = 0;
  virtual void Clear() = 0;
};

// The three session maps shared by every backend. Holds no policy about
// persistence; callers decide when an entry becomes visible.
class TokenTable {
 public:
  [[nodiscard]] const std::string* FindToken(const std::string& entity_type, const std::string& original) const;
  [[nodiscard]] const std::string* FindOriginal(std::string_view token) const;

  [[nodiscard]] std::uint64_t Counter(const std::string& entity_type) const;
  void SetCounter(const std::string& entity_type, std::uint64_t value);
  void Insert(const std::string& entity_type, const std::string& original, const std::string& token);

  [[nodiscard]] std::string Rehydrate(std::string_view text) const;

  [[nodiscard]] std::size_t Size() const { return token_to_pii_.size(); }
  [[nodiscard]] std::size_t LongestToken() const { return longest_; }
  [[nodiscard]] const std::map<std::string, std::string, std::less<>>& Tokens() const { return token_to_pii_; }
  void Clear();

 private:
  std::map<std::pair<std::string, std::string>, std::string> pii_to_token_;
  std::map<std::string, std::string, std::less<>> token_to_pii_;
  std::map<std::string, std::uint64_t> counters_;
  std::size_t longest_ = 0;
};

class InMemoryVault final : public Vault {
 public:
  InMemoryVault() = default;

  std::string GetOrCreateToken(const std::string& entity_type, const std::string& original) override;

  [[nodiscard]] std::string Rehydrate(std::string_view text) const override { return table_.Rehydrate(text); }
  [[nodiscard]] std::optional<std::string> LookupToken(std::string_view token) const override;
  [[nodiscard]] std::optional<std::string> LookupPii(const std::string& entity_type,
                                                     const std::string& original) const override;

  [[nodiscard]] std::size_t Size() const override { return table_.Size(); }
  [[nodiscard]] std::size_t LongestToken() const override { return table_.LongestToken(); }
  [[nodiscard]] std::map<std::string, std::string> Dump() const override;
  void Clear() override { table_.Clear(); }

 private:
  TokenTable table_;
};

}  // namespace veil
