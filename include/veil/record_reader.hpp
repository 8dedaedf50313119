#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil/pipeline.hpp"
#include "veil/vault.hpp"

namespace veil {

struct RecordReadOptions {
  std::vector<std::string> text_fields = {"text", "content"};
};

struct RecordStats {
  std::size_t records = 0;
  std::size_t skipped = 0;
};

// Reads conversation records from .jsonl, .json, .gz and .xz files. A record
// is a message array, an object holding a "messages" array, or an object with
// one of the configured string text fields. Compressed files are decoded as a
// stream and read as JSON lines, unless the inner extension is ".json".
class RecordReader {
 public:
  using RecordFn = std::function<void(const nlohmann::json&)>;

  explicit RecordReader(RecordReadOptions options = {});

  // False when the file cannot be opened or decompressed. Records decoded
  // before a decompression failure have already been passed to fn.
  bool ForEachRecord(const std::string& path, const RecordFn& fn, RecordStats* stats = nullptr) const;

  [[nodiscard]] bool IsRecord(const nlohmann::json& j) const;
  [[nodiscard]] const RecordReadOptions& Options() const { return options_; }

 private:
  bool ReadJsonl(const std::string& path, const RecordFn& fn, RecordStats& stats) const;
  bool ReadJson(const std::string& path, const RecordFn& fn, RecordStats& stats) const;
  bool ReadGz(const std::string& path, const RecordFn& fn, RecordStats& stats) const;
  bool ReadXz(const std::string& path, const RecordFn& fn, RecordStats& stats) const;

  using ChunkFn = std::function<void(std::string_view)>;
  using SourceFn = std::function<bool(const ChunkFn&)>;
  bool ReadDecoded(const std::string& path, const SourceFn& source, const RecordFn& fn, RecordStats& stats) const;

  void EmitDocument(const nlohmann::json& doc, const RecordFn& fn, RecordStats& stats) const;
  void EmitLine(const std::string& line, const RecordFn& fn, RecordStats& stats) const;

  RecordReadOptions options_;
};

// Returns a redacted copy of record; values that are not records come back as is.
[[nodiscard]] nlohmann::json RedactRecord(const RedactionPipeline& pipeline, const nlohmann::json& record,
                                          Vault& vault, const RecordReadOptions& options = {});

// Redacts every record of in_path into out_path as JSON lines. Throws
// std::runtime_error when either file cannot be used.
RecordStats RedactFile(const RedactionPipeline& pipeline, Vault& vault, const std::string& in_path,
                       const std::string& out_path, const RecordReadOptions& options = {});

}  // namespace veil
