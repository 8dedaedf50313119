#include "veil/record_reader.hpp"

#include <lzma.h>
#include <zlib.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace veil {

namespace {

bool IsMessageArray(const nlohmann::json& j) {
  if (!j.is_array() || j.empty()) {
    return false;
  }
  for (const auto& item : j) {
    if (!item.is_object() || !item.contains("role")) {
      return false;
    }
  }
  return true;
}

// Owns an xz decoder (concatenated streams allowed) for one input file.
class XzDecoder {
 public:
  XzDecoder() : ready_(lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED) == LZMA_OK) {}
  ~XzDecoder() { lzma_end(&strm_); }

  XzDecoder(const XzDecoder&) = delete;
  XzDecoder& operator=(const XzDecoder&) = delete;

  // Decodes all of in, handing each decoded block to on_chunk. False on a
  // read error or a corrupt or truncated stream.
  bool Pump(std::istream& in, const std::function<void(std::string_view)>& on_chunk) {
    if (!ready_) {
      return false;
    }
    std::vector<std::uint8_t> in_buf(1 << 16);
    std::vector<std::uint8_t> out_buf(1 << 16);
    lzma_action action = LZMA_RUN;

    for (;;) {
      if (strm_.avail_in == 0 && action == LZMA_RUN) {
        in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
        if (in.bad()) {
          return false;
        }
        strm_.next_in = in_buf.data();
        strm_.avail_in = static_cast<std::size_t>(in.gcount());
        if (in.eof()) {
          action = LZMA_FINISH;
        }
      }

      strm_.next_out = out_buf.data();
      strm_.avail_out = out_buf.size();
      const lzma_ret ret = lzma_code(&strm_, action);
      const std::size_t produced = out_buf.size() - strm_.avail_out;
      if (produced > 0) {
        on_chunk(std::string_view(reinterpret_cast<const char*>(out_buf.data()), produced));
      }
      if (ret == LZMA_STREAM_END) {
        return true;
      }
      if (ret != LZMA_OK) {
        return false;
      }
    }
  }

 private:
  lzma_stream strm_ = LZMA_STREAM_INIT;
  bool ready_;
};

// Cuts decoded bytes into lines; the last line may lack its newline.
class LineSplitter {
 public:
  explicit LineSplitter(std::function<void(const std::string&)> on_line) : on_line_(std::move(on_line)) {}

  void Append(std::string_view data) {
    std::size_t start = 0;
    for (auto nl = data.find('\n'); nl != std::string_view::npos; nl = data.find('\n', start)) {
      pending_.append(data.substr(start, nl - start));
      on_line_(pending_);
      pending_.clear();
      start = nl + 1;
    }
    pending_.append(data.substr(start));
  }

  void Finish() {
    if (!pending_.empty()) {
      on_line_(pending_);
      pending_.clear();
    }
  }

 private:
  std::function<void(const std::string&)> on_line_;
  std::string pending_;
};

}  // namespace

RecordReader::RecordReader(RecordReadOptions options) : options_(std::move(options)) {}

bool RecordReader::IsRecord(const nlohmann::json& j) const {
  if (j.is_array()) {
    return true;
  }
  if (!j.is_object()) {
    return false;
  }
  auto it = j.find("messages");
  if (it != j.end() && it->is_array()) {
    return true;
  }
  for (const auto& field : options_.text_fields) {
    auto f = j.find(field);
    if (f != j.end() && f->is_string()) {
      return true;
    }
  }
  return false;
}

bool RecordReader::ForEachRecord(const std::string& path, const RecordFn& fn, RecordStats* stats) const {
  RecordStats local;
  RecordStats& s = stats ? *stats : local;
  auto ext = std::filesystem::path(path).extension().string();
  if (ext == ".gz") return ReadGz(path, fn, s);
  if (ext == ".xz") return ReadXz(path, fn, s);
  if (ext == ".json") return ReadJson(path, fn, s);
  return ReadJsonl(path, fn, s);
}

void RecordReader::EmitDocument(const nlohmann::json& doc, const RecordFn& fn, RecordStats& stats) const {
  if (doc.is_array() && !IsMessageArray(doc)) {
    for (const auto& item : doc) {
      if (IsRecord(item)) {
        ++stats.records;
        fn(item);
      } else {
        ++stats.skipped;
      }
    }
    return;
  }
  if (IsRecord(doc)) {
    ++stats.records;
    fn(doc);
  } else {
    ++stats.skipped;
  }
}

void RecordReader::EmitLine(const std::string& line, const RecordFn& fn, RecordStats& stats) const {
  if (line.empty() || (line.size() == 1 && line[0] == '\r')) {
    return;
  }
  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded() || !IsRecord(j)) {
    ++stats.skipped;
    return;
  }
  ++stats.records;
  fn(j);
}

bool RecordReader::ReadJsonl(const std::string& path, const RecordFn& fn, RecordStats& stats) const {
  std::ifstream in(path);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    EmitLine(line, fn, stats);
  }
  return true;
}

bool RecordReader::ReadJson(const std::string& path, const RecordFn& fn, RecordStats& stats) const {
  std::ifstream in(path);
  if (!in) return false;
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    ++stats.skipped;
    return true;
  }
  EmitDocument(j, fn, stats);
  return true;
}

bool RecordReader::ReadDecoded(const std::string& path, const SourceFn& source, const RecordFn& fn,
                               RecordStats& stats) const {
  // "name.json.gz" holds one document; every other compressed file holds JSON lines.
  if (std::filesystem::path(path).stem().extension() == ".json") {
    std::string payload;
    if (!source([&](std::string_view chunk) { payload.append(chunk); })) {
      return false;
    }
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
      ++stats.skipped;
      return true;
    }
    EmitDocument(j, fn, stats);
    return true;
  }

  LineSplitter lines([&](const std::string& line) { EmitLine(line, fn, stats); });
  if (!source([&](std::string_view chunk) { lines.Append(chunk); })) {
    return false;
  }
  lines.Finish();
  return true;
}

bool RecordReader::ReadGz(const std::string& path, const RecordFn& fn, RecordStats& stats) const {
  std::unique_ptr<gzFile_s, decltype(&gzclose)> gz(gzopen(path.c_str(), "rb"), &gzclose);
  if (!gz) return false;
  return ReadDecoded(
      path,
      [&](const ChunkFn& on_chunk) {
        std::vector<char> buf(1 << 15);
        int read_n = 0;
        while ((read_n = gzread(gz.get(), buf.data(), static_cast<unsigned>(buf.size()))) > 0) {
          on_chunk(std::string_view(buf.data(), static_cast<std::size_t>(read_n)));
        }
        return read_n == 0;
      },
      fn, stats);
}

bool RecordReader::ReadXz(const std::string& path, const RecordFn& fn, RecordStats& stats) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  XzDecoder decoder;
  return ReadDecoded(
      path, [&](const ChunkFn& on_chunk) { return decoder.Pump(in, on_chunk); }, fn, stats);
}

nlohmann::json RedactRecord(const RedactionPipeline& pipeline, const nlohmann::json& record, Vault& vault,
                            const RecordReadOptions& options) {
  if (record.is_array()) {
    return pipeline.RedactMessages(record, vault);
  }
  if (!record.is_object()) {
    return record;
  }

  nlohmann::json out = record;
  auto messages = out.find("messages");
  if (messages != out.end() && messages->is_array()) {
    *messages = pipeline.RedactMessages(*messages, vault);
    return out;
  }
  for (const auto& field : options.text_fields) {
    auto it = out.find(field);
    if (it != out.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
      *it = pipeline.Redact(it->get_ref<const std::string&>(), vault).text;
    }
  }
  return out;
}

RecordStats RedactFile(const RedactionPipeline& pipeline, Vault& vault, const std::string& in_path,
                       const std::string& out_path, const RecordReadOptions& options) {
  std::ofstream out(out_path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("cannot open output file: " + out_path);
  }

  RecordReader reader(options);
  RecordStats stats;
  bool ok = reader.ForEachRecord(
      in_path, [&](const nlohmann::json& record) { out << RedactRecord(pipeline, record, vault, options).dump() << '\n'; },
      &stats);
  if (!ok) {
    throw std::runtime_error("cannot read input file: " + in_path);
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed writing output file: " + out_path);
  }
  return stats;
}

}  // namespace veil
