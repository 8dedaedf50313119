#include <iostream>
#include <string>
#include <vector>

#include "veil/pipeline.hpp"
#include "veil/stream.hpp"
#include "veil/vault.hpp"

int main() {
  using namespace veil;

  RedactorOptions opts;
  opts.use_model = false;
  RedactionPipeline pipeline(opts);
  InMemoryVault vault;

  auto redacted = pipeline.Redact("Hi, I'm reachable at jane.doe@example.com or 0412 345 678.", vault);
  std::cout << "Redacted: " << redacted.text << '\n';
  for (const auto& m : redacted.entities) {
    std::cout << "  " << m.entity_type << " [" << m.start << ", " << m.end << ") score=" << m.score << '\n';
  }

  // A reply from the model arrives in small pieces that split tokens.
  std::string reply = "Sure, I'll write to " + vault.LookupPii("EMAIL", "jane.doe@example.com").value_or("?") + " today.";
  StreamingRehydrator stream(vault);
  std::cout << "Rehydrated:";
  for (std::size_t i = 0; i < reply.size(); i += 5) {
    std::cout << stream.Feed(std::string_view(reply).substr(i, 5));
  }
  std::cout << stream.Flush() << '\n';
  return 0;
}
