#pragma once

#include <memory>
#include <string>
#include <vector>

#include "veil/vault.hpp"

struct sqlite3;

namespace veil {

// Durable vault over a SQLite file. Mappings and counters for the owning
// session are loaded at construction; every lookup is served from memory and
// every new token is committed before it becomes visible.
class SqliteVault final : public Vault {
 public:
  SqliteVault(std::string session_id, const std::string& db_path);
  ~SqliteVault() override;

  SqliteVault(const SqliteVault&) = delete;
  SqliteVault& operator=(const SqliteVault&) = delete;

  std::string GetOrCreateToken(const std::string& entity_type, const std::string& original) override;

  [[nodiscard]] std::string Rehydrate(std::string_view text) const override;
  [[nodiscard]] std::optional<std::string> LookupToken(std::string_view token) const override;
  [[nodiscard]] std::optional<std::string> LookupPii(const std::string& entity_type,
                                                     const std::string& original) const override;

  [[nodiscard]] std::size_t Size() const override;
  [[nodiscard]] std::size_t LongestToken() const override { return cache_.LongestToken(); }
  [[nodiscard]] std::map<std::string, std::string> Dump() const override;
  void Clear() override;

  [[nodiscard]] std::vector<std::string> ListSessions() const;
  void DeleteSession(const std::string& session_id);
  void Close();

  [[nodiscard]] const std::string& SessionId() const { return session_id_; }
  [[nodiscard]] bool IsOpen() const { return db_ != nullptr; }

 private:
  struct DbCloser {
    void operator()(sqlite3* db) const;
  };

  void Load();
  void EnsureOpen() const;
  void Exec(const char* sql);
  void DeleteRows(const std::string& session_id);

  std::string session_id_;
  std::unique_ptr<sqlite3, DbCloser> db_;
  TokenTable cache_;
};

}  // namespace veil
