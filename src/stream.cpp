#include "veil/stream.hpp"

#include <algorithm>

namespace veil {

namespace {

bool IsUpperOrUnderscore(char c) { return (c >= 'A' && c <= 'Z') || c == '_'; }
bool IsDigit(char c) { return c >= '0' && c <= '9'; }

// Bytes at the end of text that could begin an opening delimiter.
std::size_t PartialOpenSuffix(std::string_view text) {
  for (std::size_t n = std::min(text.size(), kTokenOpen.size() - 1); n > 0; --n) {
    if (text.substr(text.size() - n) == kTokenOpen.substr(0, n)) {
      return n;
    }
  }
  return 0;
}

}  // namespace

bool LooksLikeToken(std::string_view text) {
  if (text.size() < kTokenOpen.size() + kTokenClose.size() ||
      text.substr(0, kTokenOpen.size()) != kTokenOpen ||
      text.substr(text.size() - kTokenClose.size()) != kTokenClose) {
    return false;
  }
  auto body = text.substr(kTokenOpen.size(), text.size() - kTokenOpen.size() - kTokenClose.size());
  auto sep = body.rfind('_');
  if (sep == std::string_view::npos || sep == 0) {
    return false;
  }
  auto type = body.substr(0, sep);
  auto digits = body.substr(sep + 1);
  return digits.size() >= 3 && std::all_of(type.begin(), type.end(), IsUpperOrUnderscore) &&
         std::all_of(digits.begin(), digits.end(), IsDigit);
}

std::string StreamingRehydrator::Feed(std::string_view chunk) {
  buffer_.append(chunk);
  std::string out;
  Drain(out);
  return out;
}

std::string StreamingRehydrator::Flush() {
  std::string out;
  if (!buffer_.empty()) {
    out = vault_.Rehydrate(buffer_);
    buffer_.clear();
  }
  return out;
}

void StreamingRehydrator::Drain(std::string& out) {
  const std::size_t open_len = kTokenOpen.size();
  const std::size_t close_len = kTokenClose.size();

  while (!buffer_.empty()) {
    const auto open = buffer_.find(kTokenOpen);
    if (open == std::string::npos) {
      const std::size_t keep = PartialOpenSuffix(buffer_);
      out += vault_.Rehydrate(std::string_view(buffer_).substr(0, buffer_.size() - keep));
      buffer_.erase(0, buffer_.size() - keep);
      return;
    }

    if (open > 0) {
      out += vault_.Rehydrate(std::string_view(buffer_).substr(0, open));
      buffer_.erase(0, open);
      continue;
    }

    const auto close = buffer_.find(kTokenClose, open_len);
    if (close != std::string::npos) {
      const std::size_t span_end = close + close_len;
      const std::string_view candidate = std::string_view(buffer_).substr(0, span_end);
      if (LooksLikeToken(candidate)) {
        if (auto original = vault_.LookupToken(candidate)) {
          out += *original;
        } else {
          out.append(candidate);
        }
        buffer_.erase(0, span_end);
        continue;
      }

      const auto next_open = buffer_.find(kTokenOpen, open_len);
      const std::size_t literal_end = (next_open != std::string::npos && next_open < close) ? next_open : span_end;
      out.append(buffer_, 0, literal_end);
      buffer_.erase(0, literal_end);
      continue;
    }

    // Issued tokens may be longer than the configured bound.
    if (buffer_.size() > std::max(max_token_bytes_, vault_.LongestToken())) {
      out.append(kTokenOpen);
      buffer_.erase(0, open_len);
      continue;
    }
    return;
  }
}

}  // namespace veil
