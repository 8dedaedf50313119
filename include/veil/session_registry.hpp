#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "veil/vault.hpp"

namespace veil {

enum class VaultBackend { kMemory, kSqlite };

struct VaultOptions {
  VaultBackend backend = VaultBackend::kSqlite;
  std::string path = "~/.veil/vault.db";
  // SQLite sessions kept open at once; the least recently used one is closed
  // when a new session would exceed it. Memory sessions are never evicted.
  std::size_t max_open_sessions = 128;
};

[[nodiscard]] VaultBackend ParseVaultBackend(const std::string& name);
[[nodiscard]] const char* VaultBackendName(VaultBackend backend);

// Owns one vault per session id. Each vault is guarded by its own mutex, so
// different sessions proceed in parallel while calls on one session serialize.
// Entries are shared with in-flight calls, so deleting or evicting a session
// never pulls a vault out from under a running WithVault.
class SessionRegistry {
 public:
  explicit SessionRegistry(VaultOptions options = {}) : options_(std::move(options)) {}

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Runs fn(Vault&) with the session's vault locked, opening it on first use.
  template <typename Fn>
  decltype(auto) WithVault(const std::string& session_id, Fn&& fn) {
    std::shared_ptr<Entry> entry = Acquire(session_id);
    std::lock_guard<std::mutex> lock(entry->mu);
    return fn(*entry->vault);
  }

  // Sessions with stored mappings; for the memory backend, the open sessions.
  [[nodiscard]] std::vector<std::string> ListSessions();
  // Drops the session's mappings and forgets its vault.
  void DeleteSession(const std::string& session_id);
  [[nodiscard]] std::size_t OpenSessions() const;

  [[nodiscard]] const VaultOptions& Options() const { return options_; }

 private:
  struct Entry {
    std::mutex mu;
    std::unique_ptr<Vault> vault;
    std::uint64_t last_used = 0;  // guarded by the registry mutex
  };

  std::shared_ptr<Entry> Acquire(const std::string& session_id);
  void EvictIdle();
  [[nodiscard]] std::unique_ptr<Vault> Open(const std::string& session_id) const;

  VaultOptions options_;
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Entry>> entries_;
  std::uint64_t clock_ = 0;
};

}  // namespace veil
