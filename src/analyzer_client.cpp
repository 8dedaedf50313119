#include "veil/analyzer_client.hpp"

#include <httplib.h>

#include <algorithm>

#include "veil/errors.hpp"

namespace veil {

namespace {

std::size_t CodepointLength(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

}  // namespace

std::vector<std::size_t> CodepointByteOffsets(std::string_view text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);
  std::size_t i = 0;
  while (i < text.size()) {
    offsets.push_back(i);
    i = std::min(text.size(), i + CodepointLength(static_cast<unsigned char>(text[i])));
  }
  offsets.push_back(text.size());
  return offsets;
}

nlohmann::json BuildAnalyzeRequest(std::string_view text, const std::string& language,
                                   const std::vector<std::string>& entities, double score_threshold) {
  nlohmann::json req;
  req["text"] = std::string(text);
  req["language"] = language;
  req["entities"] = entities;
  req["score_threshold"] = score_threshold;
  return req;
}

std::vector<RecognizedEntity> ParseAnalyzeResponse(const nlohmann::json& body, std::string_view text) {
  if (!body.is_array()) {
    throw ScanError("analyzer response is not a JSON array");
  }
  const auto offsets = CodepointByteOffsets(text);
  const std::size_t n_codepoints = offsets.size() - 1;

  std::vector<RecognizedEntity> out;
  out.reserve(body.size());
  for (const auto& item : body) {
    try {
      auto start = item.at("start").get<std::size_t>();
      auto end = item.at("end").get<std::size_t>();
      if (start >= end || end > n_codepoints) {
        throw ScanError("analyzer returned an out-of-range span");
      }
      out.push_back(RecognizedEntity{item.at("entity_type").get<std::string>(), offsets[start], offsets[end],
                                     item.at("score").get<double>()});
    } catch (const nlohmann::json::exception& e) {
      throw ScanError(std::string("malformed analyzer result: ") + e.what());
    }
  }
  return out;
}

std::vector<RecognizedEntity> AnalyzerClient::Analyze(std::string_view text, const std::string& language,
                                                      const std::vector<std::string>& entities,
                                                      double score_threshold) const {
  httplib::Client client(options_.base_url);
  client.set_keep_alive(false);
  client.set_connection_timeout(options_.connect_timeout_sec);
  client.set_read_timeout(options_.read_timeout_sec);

  const auto payload = BuildAnalyzeRequest(text, language, entities, score_threshold).dump();
  auto res = client.Post(options_.path.c_str(), payload, "application/json");
  if (!res) {
    throw ScanError("analyzer request failed: " + options_.base_url + options_.path +
                    " (error=" + std::to_string(static_cast<int>(res.error())) + ")");
  }
  if (res->status < 200 || res->status >= 300) {
    throw ScanError("analyzer returned status " + std::to_string(res->status) + ": " + res->body);
  }

  auto body = nlohmann::json::parse(res->body, nullptr, false);
  if (body.is_discarded()) {
    throw ScanError("analyzer returned invalid JSON");
  }
  return ParseAnalyzeResponse(body, text);
}

std::shared_ptr<RecognizerCache> MakeAnalyzerCache(AnalyzerClientOptions options) {
  return std::make_shared<RecognizerCache>(
      [options](const std::string&) -> std::shared_ptr<EntityRecognizer> {
        return std::make_shared<AnalyzerClient>(options);
      });
}

}  // namespace veil
