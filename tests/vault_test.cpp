#include <cassert>
#include <stdexcept>
#include <string>

#include "veil/vault.hpp"

int main() {
  using namespace veil;

  assert(FormatToken("EMAIL", 1) == "\xC2\xAB" "EMAIL_001" "\xC2\xBB");
  assert(FormatToken("SSN", 42) == "\xC2\xAB" "SSN_042" "\xC2\xBB");
  assert(FormatToken("PHONE", 1000) == "\xC2\xAB" "PHONE_1000" "\xC2\xBB");

  InMemoryVault vault;
  assert(vault.Size() == 0);

  const std::string a = vault.GetOrCreateToken("EMAIL", "john@acme.com");
  const std::string b = vault.GetOrCreateToken("EMAIL", "jane@acme.com");
  const std::string c = vault.GetOrCreateToken("PERSON", "John");
  assert(a == FormatToken("EMAIL", 1));
  assert(b == FormatToken("EMAIL", 2));
  assert(c == FormatToken("PERSON", 1));

  // Same value, same token.
  assert(vault.GetOrCreateToken("EMAIL", "john@acme.com") == a);
  assert(vault.Size() == 3);

  // The same literal under a different type is a different entry.
  const std::string d = vault.GetOrCreateToken("PERSON", "john@acme.com");
  assert(d == FormatToken("PERSON", 2));
  assert(vault.Size() == 4);

  assert(vault.LookupToken(a).value() == "john@acme.com");
  assert(!vault.LookupToken(FormatToken("EMAIL", 99)).has_value());
  assert(vault.LookupPii("EMAIL", "jane@acme.com").value() == b);
  assert(!vault.LookupPii("EMAIL", "nobody@acme.com").has_value());

  {
    const std::string text = "Hi " + c + ", mail " + a + " and " + a + "; unknown " + FormatToken("EMAIL", 7);
    const std::string back = vault.Rehydrate(text);
    assert(back == "Hi John, mail john@acme.com and john@acme.com; unknown " + FormatToken("EMAIL", 7));
  }

  assert(vault.Rehydrate("plain text") == "plain text");
  assert(vault.Rehydrate("") == "");

  auto dump = vault.Dump();
  assert(dump.size() == 4);
  assert(dump.at(b) == "jane@acme.com");

  {
    // Ordinals past 999 keep growing and stay distinct after rehydration.
    InMemoryVault big;
    std::string last;
    for (int i = 1; i <= 1000; ++i) {
      last = big.GetOrCreateToken("ID", "value-" + std::to_string(i));
    }
    assert(last == FormatToken("ID", 1000));
    assert(big.Rehydrate(FormatToken("ID", 100) + FormatToken("ID", 1000)) == "value-100value-1000");
  }

  {
    // Token types follow [A-Z_]+; anything else is refused before a token is issued.
    assert(IsEntityType("US_SSN") && IsEntityType("_"));
    assert(!IsEntityType("") && !IsEntityType("Project") && !IsEntityType("ID2"));
    assert(NormalizeEntityType("Project") == "PROJECT");
    assert(NormalizeEntityType("api-key 2") == "API_KEY__");

    InMemoryVault typed;
    bool threw = false;
    try {
      (void)typed.GetOrCreateToken("Project", "Apollo");
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
    assert(typed.Size() == 0);
  }

  vault.Clear();
  assert(vault.Size() == 0);
  assert(!vault.LookupToken(a).has_value());
  assert(vault.Rehydrate(a) == a);
  // Counters restart after a clear.
  assert(vault.GetOrCreateToken("EMAIL", "someone@else.com") == FormatToken("EMAIL", 1));

  return 0;
}
