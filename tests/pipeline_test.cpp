#include <atomic>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil/errors.hpp"
#include "veil/pipeline.hpp"
#include "veil/stream.hpp"
#include "veil/vault.hpp"

namespace {

// Finds fixed words and reports them the way an NER engine would.
class FakeRecognizer final : public veil::EntityRecognizer {
 public:
  std::vector<veil::RecognizedEntity> Analyze(std::string_view text, const std::string& language,
                                              const std::vector<std::string>& entities,
                                              double score_threshold) const override {
    assert(language == "en");
    assert(!entities.empty());
    assert(score_threshold > 0.0);
    std::vector<veil::RecognizedEntity> out;
    Add(text, "Alice", "PERSON", 0.85, out);
    Add(text, "Sydney", "LOCATION", 0.2, out);
    // Overlaps an email the structured layer already owns.
    Add(text, "acme.com", "URL", 0.9, out);
    return out;
  }

 private:
  static void Add(std::string_view text, std::string_view word, const char* type, double score,
                  std::vector<veil::RecognizedEntity>& out) {
    auto pos = text.find(word);
    if (pos != std::string_view::npos) {
      out.push_back(veil::RecognizedEntity{type, pos, pos + word.size(), score});
    }
  }
};

veil::RedactorOptions StructuredOnly() {
  veil::RedactorOptions opts;
  opts.use_model = false;
  return opts;
}

}  // namespace

int main() {
  using namespace veil;

  {
    RedactionPipeline pipeline(StructuredOnly());
    InMemoryVault vault;
    const std::string input = "Email: john@acme.com";
    auto result = pipeline.Redact(input, vault);
    assert(result.text == "Email: " + FormatToken("EMAIL", 1));
    assert(result.entities.size() == 1);
    assert(result.token_map.size() == 1);
    assert(result.token_map.at(FormatToken("EMAIL", 1)) == "john@acme.com");
    assert(vault.Rehydrate(result.text) == input);

    // A second message in the same session reuses the token.
    auto again = pipeline.Redact("cc john@acme.com", vault);
    assert(again.text == "cc " + FormatToken("EMAIL", 1));
    assert(vault.Size() == 1);
  }

  {
    RedactionPipeline pipeline(StructuredOnly());
    InMemoryVault vault;
    const std::string input = "Email john@a.com or jane@b.com, SSN 123-45-6789";
    auto result = pipeline.Redact(input, vault);
    assert(result.entities.size() == 3);
    assert(result.token_map.size() == 3);
    assert(vault.Size() == 3);
    // Tokens are issued while substituting from the end of the text backwards.
    assert(vault.LookupPii("SSN", "123-45-6789").value() == FormatToken("SSN", 1));
    assert(vault.LookupPii("EMAIL", "jane@b.com").value() == FormatToken("EMAIL", 1));
    assert(vault.LookupPii("EMAIL", "john@a.com").value() == FormatToken("EMAIL", 2));
    assert(result.text == "Email " + FormatToken("EMAIL", 2) + " or " + FormatToken("EMAIL", 1) + ", SSN " +
                              FormatToken("SSN", 1));
    assert(vault.Rehydrate(result.text) == input);
  }

  {
    RedactionPipeline pipeline(StructuredOnly());
    InMemoryVault vault;
    auto result = pipeline.Redact("", vault);
    assert(result.text.empty() && result.entities.empty());
    assert(pipeline.Redact("hello there", vault).text == "hello there");
  }

  {
    auto opts = StructuredOnly();
    opts.allow_list = {"support@acme.com"};
    opts.skip_types = {"IP_ADDRESS"};
    RedactionPipeline pipeline(opts);
    InMemoryVault vault;
    auto result = pipeline.Redact("write support@acme.com from 10.0.0.1 as bob@x.io", vault);
    assert(result.text == "write support@acme.com from 10.0.0.1 as " + FormatToken("EMAIL", 1));
  }

  {
    std::atomic<int> built{0};
    auto cache = std::make_shared<RecognizerCache>([&](const std::string& language) {
      assert(language == "en");
      ++built;
      return std::make_shared<FakeRecognizer>();
    });
    RedactionPipeline pipeline(RedactorOptions{}, cache);
    InMemoryVault vault;

    const std::string input = "Alice from Sydney, alice@acme.com";
    auto result = pipeline.Redact(input, vault);
    assert(result.entities.size() == 2);
    assert(result.entities[0].entity_type == "PERSON");
    assert(result.entities[0].source == "model");
    assert(result.entities[1].entity_type == "EMAIL");
    assert(result.text == FormatToken("PERSON", 1) + " from Sydney, " + FormatToken("EMAIL", 1));
    assert(vault.Rehydrate(result.text) == input);

    (void)pipeline.Redact("Alice again", vault);
    assert(built == 1);
    assert(cache->Loaded() == 1);
    cache->Reset();
    assert(cache->Loaded() == 0);
  }

  {
    bool threw = false;
    try {
      RedactionPipeline pipeline(RedactorOptions{}, nullptr);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  {
    RedactionPipeline pipeline(StructuredOnly());
    pipeline.AddScanner(std::make_shared<FunctionScanner>("projects", [](std::string_view text) {
      std::vector<EntityMatch> out;
      auto pos = text.find("Apollo");
      if (pos != std::string_view::npos) {
        out.push_back(EntityMatch{"PROJECT", pos, pos + 6, "Apollo", 0.9, ""});
      }
      return out;
    }));
    InMemoryVault vault;
    auto result = pipeline.Redact("Apollo ships; mail ops@nasa.gov", vault);
    assert(result.text == FormatToken("PROJECT", 1) + " ships; mail " + FormatToken("EMAIL", 1));
    assert(result.entities[0].source == "projects");
  }

  {
    // Scanner-supplied types are normalized to token types, and long ones still stream.
    RedactionPipeline pipeline(StructuredOnly());
    pipeline.AddScanner(std::make_shared<FunctionScanner>("tickets", [](std::string_view text) {
      std::vector<EntityMatch> out;
      auto pos = text.find("Apollo");
      if (pos != std::string_view::npos) {
        out.push_back(EntityMatch{"Project", pos, pos + 6, "Apollo", 0.9, ""});
      }
      pos = text.find("T-1234");
      if (pos != std::string_view::npos) {
        out.push_back(EntityMatch{"Internal Support Ticket Reference For Escalated Billing Case", pos, pos + 6,
                                  "T-1234", 0.9, ""});
      }
      out.push_back(EntityMatch{"", 0, 1, "x", 0.9, ""});
      return out;
    }));
    InMemoryVault vault;
    auto result = pipeline.Redact("Apollo raised T-1234", vault);
    assert(result.entities.size() == 2);
    assert(result.entities[0].entity_type == "PROJECT");
    assert(result.entities[1].entity_type == "INTERNAL_SUPPORT_TICKET_REFERENCE_FOR_ESCALATED_BILLING_CASE");
    assert(result.text.substr(0, FormatToken("PROJECT", 1).size()) == FormatToken("PROJECT", 1));

    StreamingRehydrator stream(vault);
    std::string streamed;
    for (char c : result.text) {
      streamed += stream.Feed(std::string(1, c));
    }
    streamed += stream.Flush();
    assert(streamed == "Apollo raised T-1234");
    assert(streamed == vault.Rehydrate(result.text));
  }

  {
    RedactionPipeline pipeline(StructuredOnly());
    pipeline.AddScanner(std::make_shared<FunctionScanner>("broken", [](std::string_view) -> std::vector<EntityMatch> {
      throw std::runtime_error("backend down");
    }));
    InMemoryVault vault;
    bool threw = false;
    try {
      (void)pipeline.Redact("john@acme.com", vault);
    } catch (const ScanError& e) {
      threw = std::string(e.what()).find("broken") != std::string::npos;
    }
    assert(threw);
    // Nothing is issued when detection fails.
    assert(vault.Size() == 0);
  }

  {
    RedactionPipeline pipeline(StructuredOnly());
    InMemoryVault vault;
    const nlohmann::json messages = {
        {{"role", "system"}, {"content", "You are helpful."}},
        {{"role", "user"}, {"content", "I am john@acme.com"}},
        {{"role", "user"}, {"content", ""}},
        {{"role", "user"}, {"content", nlohmann::json::array({{{"type", "text"}, {"text", "a@b.com"}}})}},
        {{"role", "tool"}, {"name", "lookup"}},
        "not an object",
    };
    const nlohmann::json before = messages;
    auto out = pipeline.RedactMessages(messages, vault);
    assert(messages == before);
    assert(out.size() == messages.size());
    assert(out[0] == messages[0]);
    assert(out[1]["role"] == "user");
    assert(out[1]["content"] == "I am " + FormatToken("EMAIL", 1));
    assert(out[2] == messages[2]);
    assert(out[3] == messages[3]);
    assert(out[4] == messages[4]);
    assert(out[5] == messages[5]);

    auto custom = pipeline.RedactMessages(nlohmann::json::array({{{"role", "user"}, {"body", "x@y.com"}}}), vault,
                                          "body");
    assert(custom[0]["body"] == FormatToken("EMAIL", 2));
  }

  return 0;
}
