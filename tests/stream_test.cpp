#include <cassert>
#include <string>
#include <vector>

#include "veil/stream.hpp"
#include "veil/vault.hpp"

namespace {

std::string FeedChunks(const veil::Vault& vault, const std::vector<std::string>& chunks, std::size_t bound = 64) {
  veil::StreamingRehydrator stream(vault, bound);
  std::string out;
  for (const auto& c : chunks) {
    out += stream.Feed(c);
  }
  out += stream.Flush();
  assert(stream.Pending() == 0);
  return out;
}

}  // namespace

int main() {
  using namespace veil;

  InMemoryVault vault;
  const std::string email = vault.GetOrCreateToken("EMAIL", "john@acme.com");
  const std::string person = vault.GetOrCreateToken("PERSON", "John Smith");
  const std::string open = std::string(kTokenOpen);
  const std::string close = std::string(kTokenClose);

  assert(LooksLikeToken(email));
  assert(LooksLikeToken(FormatToken("US_SSN", 1234)));
  assert(!LooksLikeToken(open + "email_001" + close));
  assert(!LooksLikeToken(open + "EMAIL_01" + close));
  assert(!LooksLikeToken(open + "_001" + close));
  assert(!LooksLikeToken(open + " lone " + close));

  const std::vector<std::string> samples = {
      "Dear " + person + ", we wrote to " + email + ".",
      email + email,
      "unknown " + FormatToken("EMAIL", 9) + " stays",
      "quote " + open + " not a token " + close + " then " + email,
      "nested " + open + "abc " + email + " end",
      "dangling " + open + "EMAIL_0",
      "price \xC2\xA3" "5 for " + person,
  };

  for (const auto& text : samples) {
    const std::string expected = vault.Rehydrate(text);

    assert(FeedChunks(vault, {text}) == expected);

    // Every two-way split, including splits inside the two-byte delimiters.
    for (std::size_t cut = 0; cut <= text.size(); ++cut) {
      assert(FeedChunks(vault, {text.substr(0, cut), text.substr(cut)}) == expected);
    }

    std::vector<std::string> bytes;
    for (char c : text) {
      bytes.emplace_back(1, c);
    }
    assert(FeedChunks(vault, bytes) == expected);
  }

  {
    // Complete tokens are released as soon as their closing delimiter arrives.
    StreamingRehydrator stream(vault);
    assert(stream.Feed("Hi " + email.substr(0, 4)) == "Hi ");
    assert(stream.Feed(email.substr(4)) == "john@acme.com");
    assert(stream.Flush().empty());
  }

  {
    // A trailing first byte of the opening delimiter is held back.
    StreamingRehydrator stream(vault);
    assert(stream.Feed("abc\xC2") == "abc");
    assert(stream.Pending() == 1);
    assert(stream.Feed(email.substr(1)) == "john@acme.com");
  }

  {
    // Without a closing delimiter, the bound forces the opener out.
    StreamingRehydrator stream(vault, 16);
    std::string out = stream.Feed(open + std::string(40, 'x'));
    assert(out == open + std::string(40, 'x'));
    assert(stream.Pending() == 0);
  }

  {
    // Below the bound the stream waits.
    StreamingRehydrator stream(vault, 64);
    assert(stream.Feed(open + "EMAIL").empty());
    assert(stream.Flush() == open + "EMAIL");
  }

  {
    // Tokens longer than the configured bound still rehydrate when split per byte.
    InMemoryVault long_vault;
    const std::string type = "INTERNAL_CUSTOMER_ACCOUNT_REFERENCE_IDENTIFIER_FOR_BILLING";
    const std::string token = long_vault.GetOrCreateToken(type, "ACME-0042");
    assert(token.size() > 64);
    assert(long_vault.LongestToken() == token.size());

    const std::string text = "account " + token + " closed";
    std::vector<std::string> bytes;
    for (char c : text) {
      bytes.emplace_back(1, c);
    }
    assert(FeedChunks(long_vault, bytes) == "account ACME-0042 closed");
    assert(FeedChunks(long_vault, bytes, 16) == "account ACME-0042 closed");

    long_vault.Clear();
    assert(long_vault.LongestToken() == 0);
  }

  return 0;
}
