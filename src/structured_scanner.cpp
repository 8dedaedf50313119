#include <algorithm>
#include <cctype>
#include <string>

#include <re2/re2.h>

#include "veil/errors.hpp"
#include "veil/resolver.hpp"
#include "veil/scanner.hpp"

namespace veil {

namespace {

// Longest span a PHONE match can cover; bounds the search for a digit-run end.
constexpr std::size_t kMaxPhoneBytes = 24;

enum DigitGuard : unsigned { kNoGuard = 0, kNotAfterDigit = 1, kNotBeforeDigit = 2 };

bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

StructuredPattern MakePattern(std::string type, const char* expr, double score,
                              bool icase = false, unsigned guards = kNoGuard) {
  RE2::Options opts;
  opts.set_encoding(RE2::Options::EncodingLatin1);
  opts.set_case_sensitive(!icase);
  opts.set_log_errors(false);
  auto re = std::make_shared<const RE2>(expr, opts);
  if (!re->ok()) {
    throw ScanError("bad " + type + " pattern: " + re->error());
  }
  return StructuredPattern{std::move(type), std::move(re), score, (guards & kNotAfterDigit) != 0,
                           (guards & kNotBeforeDigit) != 0};
}

}  // namespace

std::vector<EntityMatch> FunctionScanner::Scan(std::string_view text) const {
  auto matches = fn_(text);
  for (auto& m : matches) {
    if (m.source.empty()) {
      m.source = name_;
    }
  }
  return matches;
}

StructuredScanner::StructuredScanner() {
  // Order matters only for equal (score, length) ties in overlap resolution.
  patterns_.push_back(MakePattern(
      "EMAIL", R"(\b[-a-zA-Z0-9._%+]+@[-a-zA-Z0-9.]+\.[a-zA-Z]{2,}\b)", 1.0));
  patterns_.push_back(MakePattern(
      "PHONE", R"((?:\+?\d{1,3}[-.\s]?)?(?:\(?\d{2,4}\)?[-.\s]?)\d{3,4}[-.\s]?\d{3,4})", 0.85,
      false, kNotAfterDigit | kNotBeforeDigit));
  patterns_.push_back(MakePattern(
      "CREDIT_CARD",
      R"(\b(?:4\d{3}|5[1-5]\d{2}|3[47]\d{2}|6(?:011|5\d{2}))[-.\s]?\d{4}[-.\s]?\d{4}[-.\s]?\d{1,4}\b)",
      0.95));
  patterns_.push_back(MakePattern("SSN", R"(\b\d{3}[-\s]\d{2}[-\s]\d{4}\b)", 0.9));
  patterns_.push_back(MakePattern(
      "IP_ADDRESS",
      R"(\b(?:(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\.){3}(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\b)", 0.9));
  patterns_.push_back(MakePattern(
      "DATE_OF_BIRTH", R"(\b(?:\d{4}[-/]\d{1,2}[-/]\d{1,2}|\d{1,2}[-/]\d{1,2}[-/]\d{4})\b)", 0.6));
  patterns_.push_back(MakePattern("AU_TFN", R"(\b\d{3}\s?\d{3}\s?\d{2,3}\b)", 0.5));
  patterns_.push_back(MakePattern("AU_MEDICARE", R"(\b\d{4}\s?\d{5}\s?\d\b)", 0.5));
  patterns_.push_back(MakePattern(
      "URL_WITH_SECRET", R"(https?://[^\s]+[?&](?:api_key|token|secret|password|key)=[^\s&]+)", 0.95));
  patterns_.push_back(MakePattern(
      "API_KEY", R"((?:api[-_]?key|secret|token|password|bearer)\s*[:=]\s*['"]?[-a-zA-Z0-9_.]{20,}['"]?)",
      0.8, true));
}

void StructuredScanner::ScanPattern(const StructuredPattern& p, std::string_view text,
                                    std::vector<EntityMatch>& out) const {
  const re2::StringPiece input(text.data(), text.size());
  const std::size_t n = text.size();
  re2::StringPiece m;
  std::size_t pos = 0;

  // The whole input stays the match context, so \b sees the byte before pos.
  while (pos < n && p.pattern->Match(input, pos, n, RE2::UNANCHORED, &m, 1)) {
    const std::size_t s = static_cast<std::size_t>(m.data() - text.data());
    std::size_t e = s + m.size();
    if (e == s) {
      pos = s + 1;
      continue;
    }
    if (p.reject_after_digit && s > 0 && IsDigit(text[s - 1])) {
      // Every later start inside this digit run is rejected as well.
      pos = s + 1;
      while (pos < n && IsDigit(text[pos])) ++pos;
      continue;
    }
    if (p.reject_before_digit && e < n && IsDigit(text[e])) {
      // Retry the same start, anchored on each digit-run end in reach, longest first.
      const std::size_t limit = std::min(n, s + kMaxPhoneBytes);
      std::size_t found = 0;
      for (std::size_t cand = limit; cand > e; --cand) {
        if (!IsDigit(text[cand - 1]) || (cand < n && IsDigit(text[cand]))) continue;
        if (p.pattern->Match(input, s, cand, RE2::ANCHOR_BOTH, nullptr, 0)) {
          found = cand;
          break;
        }
      }
      if (found == 0) {
        pos = s + 1;
        continue;
      }
      e = found;
    }
    out.push_back(EntityMatch{p.entity_type, s, e, std::string(text.substr(s, e - s)), p.score,
                              "structured"});
    pos = e;
  }
}

std::vector<EntityMatch> StructuredScanner::Scan(std::string_view text) const {
  std::vector<EntityMatch> matches;
  for (const auto& p : patterns_) {
    ScanPattern(p, text, matches);
  }
  return ResolveOverlaps(std::move(matches));
}

}  // namespace veil
