#include "veil/sqlite_vault.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <system_error>

#include "veil/errors.hpp"

namespace veil {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS mappings (
    session_id  TEXT NOT NULL,
    entity_type TEXT NOT NULL,
    original    TEXT NOT NULL,
    token       TEXT NOT NULL,
    created_at  REAL NOT NULL DEFAULT (julianday('now')),
    PRIMARY KEY (session_id, entity_type, original)
);
CREATE INDEX IF NOT EXISTS idx_mappings_token ON mappings(session_id, token);
CREATE TABLE IF NOT EXISTS counters (
    session_id  TEXT NOT NULL,
    entity_type TEXT NOT NULL,
    count       INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (session_id, entity_type)
);
)sql";

void ExecSql(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StorageError("sqlite exec failed: " + msg);
  }
}

class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void Bind(int index, const std::string& value) {
    Check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void Bind(int index, std::uint64_t value) {
    Check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
  }

  // True while rows remain.
  bool Step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StorageError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
  }

  std::string Text(int col) const {
    const auto* p = sqlite3_column_text(stmt_, col);
    int n = sqlite3_column_bytes(stmt_, col);
    return p ? std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n)) : std::string();
  }

  std::uint64_t Count(int col) const {
    return static_cast<std::uint64_t>(std::max<sqlite3_int64>(0, sqlite3_column_int64(stmt_, col)));
  }

 private:
  void Check(int rc) {
    if (rc != SQLITE_OK) {
      throw StorageError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

void InTransaction(sqlite3* db, const std::function<void()>& body) {
  ExecSql(db, "BEGIN IMMEDIATE");
  try {
    body();
    ExecSql(db, "COMMIT");
  } catch (...) {
    sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
    throw;
  }
}

std::string ExpandHome(const std::string& path) {
  if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
    if (const char* home = std::getenv("HOME")) {
      return std::string(home) + path.substr(1);
    }
  }
  return path;
}

}  // namespace

void SqliteVault::DbCloser::operator()(sqlite3* db) const {
  sqlite3_close_v2(db);
}

SqliteVault::SqliteVault(std::string session_id, const std::string& db_path)
    : session_id_(std::move(session_id)) {
  const std::string path = ExpandHome(db_path);
  if (path != ":memory:") {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw StorageError("failed to create vault directory " + parent.string() + ": " + ec.message());
      }
    }
  }

  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
    db_.reset();
    throw StorageError("failed to open vault " + path + ": " + msg);
  }

  sqlite3_busy_timeout(db_.get(), 5000);
  Exec("PRAGMA journal_mode=WAL");
  Exec(kSchema);
  Load();
}

SqliteVault::~SqliteVault() = default;

void SqliteVault::EnsureOpen() const {
  if (!db_) {
    throw StorageError("vault for session '" + session_id_ + "' is closed");
  }
}

void SqliteVault::Exec(const char* sql) {
  EnsureOpen();
  ExecSql(db_.get(), sql);
}

void SqliteVault::Load() {
  TokenTable loaded;
  {
    Statement rows(db_.get(), "SELECT entity_type, original, token FROM mappings WHERE session_id = ?1");
    rows.Bind(1, session_id_);
    while (rows.Step()) {
      loaded.Insert(rows.Text(0), rows.Text(1), rows.Text(2));
    }
  }
  {
    Statement counts(db_.get(), "SELECT entity_type, count FROM counters WHERE session_id = ?1");
    counts.Bind(1, session_id_);
    while (counts.Step()) {
      loaded.SetCounter(counts.Text(0), counts.Count(1));
    }
  }
  cache_ = std::move(loaded);
}

std::string SqliteVault::GetOrCreateToken(const std::string& entity_type, const std::string& original) {
  if (!IsEntityType(entity_type)) {
    throw std::invalid_argument("invalid entity type '" + entity_type + "'");
  }
  EnsureOpen();
  if (const auto* existing = cache_.FindToken(entity_type, original)) {
    return *existing;
  }

  std::string token;
  std::uint64_t ordinal = 0;
  InTransaction(db_.get(), [&] {
    Statement find(db_.get(),
                   "SELECT token FROM mappings WHERE session_id = ?1 AND entity_type = ?2 AND original = ?3");
    find.Bind(1, session_id_);
    find.Bind(2, entity_type);
    find.Bind(3, original);
    if (find.Step()) {
      token = find.Text(0);
      return;
    }

    std::uint64_t current = cache_.Counter(entity_type);
    Statement counter(db_.get(), "SELECT count FROM counters WHERE session_id = ?1 AND entity_type = ?2");
    counter.Bind(1, session_id_);
    counter.Bind(2, entity_type);
    if (counter.Step()) {
      current = std::max(current, counter.Count(0));
    }
    ordinal = current + 1;
    token = FormatToken(entity_type, ordinal);

    Statement bump(db_.get(),
                   "INSERT OR REPLACE INTO counters (session_id, entity_type, count) VALUES (?1, ?2, ?3)");
    bump.Bind(1, session_id_);
    bump.Bind(2, entity_type);
    bump.Bind(3, ordinal);
    bump.Step();

    Statement insert(db_.get(),
                     "INSERT INTO mappings (session_id, entity_type, original, token) VALUES (?1, ?2, ?3, ?4)");
    insert.Bind(1, session_id_);
    insert.Bind(2, entity_type);
    insert.Bind(3, original);
    insert.Bind(4, token);
    insert.Step();
  });

  if (ordinal != 0) {
    cache_.SetCounter(entity_type, ordinal);
  }
  cache_.Insert(entity_type, original, token);
  return token;
}

std::string SqliteVault::Rehydrate(std::string_view text) const {
  EnsureOpen();
  return cache_.Rehydrate(text);
}

std::optional<std::string> SqliteVault::LookupToken(std::string_view token) const {
  EnsureOpen();
  if (const auto* original = cache_.FindOriginal(token)) {
    return *original;
  }
  return std::nullopt;
}

std::optional<std::string> SqliteVault::LookupPii(const std::string& entity_type,
                                                  const std::string& original) const {
  EnsureOpen();
  if (const auto* token = cache_.FindToken(entity_type, original)) {
    return *token;
  }
  return std::nullopt;
}

std::size_t SqliteVault::Size() const {
  EnsureOpen();
  return cache_.Size();
}

std::map<std::string, std::string> SqliteVault::Dump() const {
  EnsureOpen();
  return {cache_.Tokens().begin(), cache_.Tokens().end()};
}

void SqliteVault::DeleteRows(const std::string& session_id) {
  InTransaction(db_.get(), [&] {
    Statement mappings(db_.get(), "DELETE FROM mappings WHERE session_id = ?1");
    mappings.Bind(1, session_id);
    mappings.Step();
    Statement counters(db_.get(), "DELETE FROM counters WHERE session_id = ?1");
    counters.Bind(1, session_id);
    counters.Step();
  });
}

void SqliteVault::Clear() {
  EnsureOpen();
  DeleteRows(session_id_);
  cache_.Clear();
}

std::vector<std::string> SqliteVault::ListSessions() const {
  EnsureOpen();
  std::vector<std::string> out;
  Statement rows(db_.get(), "SELECT DISTINCT session_id FROM mappings ORDER BY session_id");
  while (rows.Step()) {
    out.push_back(rows.Text(0));
  }
  return out;
}

void SqliteVault::DeleteSession(const std::string& session_id) {
  EnsureOpen();
  DeleteRows(session_id);
  if (session_id == session_id_) {
    cache_.Clear();
  }
}

void SqliteVault::Close() {
  db_.reset();
}

}  // namespace veil
