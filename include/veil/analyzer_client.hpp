#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil/model_scanner.hpp"

namespace veil {

struct AnalyzerClientOptions {
  std::string base_url = "http://127.0.0.1:5002";  // scheme://host:port
  std::string path = "/analyze";
  int connect_timeout_sec = 5;
  int read_timeout_sec = 10;
};

// EntityRecognizer backed by a Presidio-compatible HTTP analyzer service.
class AnalyzerClient final : public EntityRecognizer {
 public:
  explicit AnalyzerClient(AnalyzerClientOptions options) : options_(std::move(options)) {}

  [[nodiscard]] std::vector<RecognizedEntity> Analyze(std::string_view text, const std::string& language,
                                                      const std::vector<std::string>& entities,
                                                      double score_threshold) const override;

  [[nodiscard]] const AnalyzerClientOptions& Options() const { return options_; }

 private:
  AnalyzerClientOptions options_;
};

[[nodiscard]] nlohmann::json BuildAnalyzeRequest(std::string_view text, const std::string& language,
                                                 const std::vector<std::string>& entities, double score_threshold);

// Converts the service's result array, whose offsets count code points, into
// byte-offset entities over text. Malformed items raise ScanError.
[[nodiscard]] std::vector<RecognizedEntity> ParseAnalyzeResponse(const nlohmann::json& body, std::string_view text);

// byte_offsets[k] is the byte offset of code point k; the last entry is text.size().
[[nodiscard]] std::vector<std::size_t> CodepointByteOffsets(std::string_view text);

// A cache whose recognizers all talk to the same service.
[[nodiscard]] std::shared_ptr<RecognizerCache> MakeAnalyzerCache(AnalyzerClientOptions options);

}  // namespace veil
