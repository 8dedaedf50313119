#include "veil/session_registry.hpp"

#include <cctype>

#include "veil/errors.hpp"
#include "veil/sqlite_vault.hpp"

namespace veil {

namespace {

// Reserved id for registry-level queries against the shared database.
constexpr const char* kAdminSession = "_list";

}  // namespace

VaultBackend ParseVaultBackend(const std::string& name) {
  std::string v;
  v.reserve(name.size());
  for (char c : name) {
    v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (v == "memory" || v == "mem" || v == "inmemory") {
    return VaultBackend::kMemory;
  }
  if (v == "sqlite" || v == "sqlite3" || v == "db") {
    return VaultBackend::kSqlite;
  }
  throw ConfigError("unknown vault backend: " + name);
}

const char* VaultBackendName(VaultBackend backend) {
  return backend == VaultBackend::kMemory ? "memory" : "sqlite";
}

std::unique_ptr<Vault> SessionRegistry::Open(const std::string& session_id) const {
  if (options_.backend == VaultBackend::kMemory) {
    return std::make_unique<InMemoryVault>();
  }
  return std::make_unique<SqliteVault>(session_id, options_.path);
}

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::Acquire(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(session_id);
  if (it != entries_.end()) {
    it->second->last_used = ++clock_;
    return it->second;
  }
  EvictIdle();
  auto entry = std::make_shared<Entry>();
  entry->vault = Open(session_id);
  entry->last_used = ++clock_;
  entries_.emplace(session_id, entry);
  return entry;
}

// Caller holds mu_. Makes room for one more SQLite session.
void SessionRegistry::EvictIdle() {
  if (options_.backend != VaultBackend::kSqlite || options_.max_open_sessions == 0) {
    return;
  }
  while (entries_.size() >= options_.max_open_sessions) {
    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->second->last_used < oldest->second->last_used) {
        oldest = it;
      }
    }
    entries_.erase(oldest);
  }
}

std::vector<std::string> SessionRegistry::ListSessions() {
  if (options_.backend == VaultBackend::kSqlite) {
    SqliteVault admin(kAdminSession, options_.path);
    return admin.ListSessions();
  }
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) {
    out.push_back(kv.first);
  }
  return out;
}

void SessionRegistry::DeleteSession(const std::string& session_id) {
  std::shared_ptr<Entry> open;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(session_id);
    if (it != entries_.end()) {
      open = std::move(it->second);
      entries_.erase(it);
    }
  }

  if (open) {
    std::lock_guard<std::mutex> lock(open->mu);
    open->vault->Clear();
    return;
  }
  if (options_.backend == VaultBackend::kSqlite) {
    SqliteVault admin(kAdminSession, options_.path);
    admin.DeleteSession(session_id);
  }
}

std::size_t SessionRegistry::OpenSessions() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

}  // namespace veil
