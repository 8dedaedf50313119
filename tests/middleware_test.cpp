#include <cassert>
#include <string>

#include <nlohmann/json.hpp>

#include "veil/middleware.hpp"

int main() {
  using namespace veil;

  const nlohmann::json messages = nlohmann::json::array({{{"role", "user"}, {"content", "ping john@acme.com"}}});

  {
    Config cfg;
    cfg.enabled = false;
    auto mw = MakeMiddleware(cfg, "s1");
    assert(!mw.Enabled());
    assert(mw.PreSend(messages) == messages);
    assert(mw.RedactText("john@acme.com") == "john@acme.com");
    assert(mw.PostReceive("as is") == "as is");
    auto stats = mw.Stats();
    assert(stats["vault_size"] == 0);
    assert(stats["mappings"].empty());
  }

  {
    Config cfg;
    cfg.redactor.use_model = false;
    cfg.vault.backend = VaultBackend::kMemory;
    auto mw = MakeMiddleware(cfg, "s1");
    assert(mw.Enabled());

    auto safe = mw.PreSend(messages);
    const std::string token = FormatToken("EMAIL", 1);
    assert(safe[0]["content"] == "ping " + token);

    const std::string reply = "I pinged " + token + ".";
    assert(mw.PostReceive(reply) == "I pinged john@acme.com.");
    assert(mw.RehydrateText(reply) == mw.PostReceive(reply));

    assert(mw.RedactText("and jane@acme.com") == "and " + FormatToken("EMAIL", 2));

    auto stream = mw.OpenStream();
    std::string out = stream.Feed(reply.substr(0, 11));
    out += stream.Feed(reply.substr(11));
    out += stream.Flush();
    assert(out == "I pinged john@acme.com.");

    auto stats = mw.Stats();
    assert(stats["vault_size"] == 2);
    assert(stats["mappings"][token] == "john@acme.com");
  }

  return 0;
}
