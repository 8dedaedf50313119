#include <cassert>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "veil/errors.hpp"
#include "veil/sqlite_vault.hpp"

namespace {

void RemoveDb(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

}  // namespace

int main() {
  using namespace veil;

  const auto dir = std::filesystem::temp_directory_path() / "veil_sqlite_vault_test";
  const auto db = dir / "nested" / "vault.db";
  std::filesystem::remove_all(dir);

  std::string john;
  std::string ssn;
  {
    SqliteVault vault("alpha", db.string());
    assert(std::filesystem::exists(db));
    assert(vault.SessionId() == "alpha");
    assert(vault.IsOpen());
    assert(vault.Size() == 0);

    john = vault.GetOrCreateToken("EMAIL", "john@acme.com");
    ssn = vault.GetOrCreateToken("SSN", "123-45-6789");
    assert(john == FormatToken("EMAIL", 1));
    assert(ssn == FormatToken("SSN", 1));
    assert(vault.GetOrCreateToken("EMAIL", "john@acme.com") == john);
    assert(vault.Size() == 2);
    assert(vault.Rehydrate("to " + john) == "to john@acme.com");
  }

  {
    // Mappings and counters survive a reopen.
    SqliteVault vault("alpha", db.string());
    assert(vault.Size() == 2);
    assert(vault.LongestToken() == john.size());
    assert(vault.LookupToken(john).value() == "john@acme.com");
    assert(vault.LookupPii("SSN", "123-45-6789").value() == ssn);
    assert(vault.GetOrCreateToken("EMAIL", "jane@acme.com") == FormatToken("EMAIL", 2));
    assert(vault.Dump().size() == 3);

    bool threw = false;
    try {
      (void)vault.GetOrCreateToken("e-mail", "x@y.com");
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
    assert(vault.Size() == 3);
  }

  {
    // Sessions are isolated in one file.
    SqliteVault beta("beta", db.string());
    assert(beta.Size() == 0);
    assert(beta.GetOrCreateToken("EMAIL", "john@acme.com") == FormatToken("EMAIL", 1));
    assert(!beta.LookupToken(FormatToken("EMAIL", 2)).has_value());

    auto sessions = beta.ListSessions();
    assert(sessions.size() == 2);
    assert(sessions[0] == "alpha" && sessions[1] == "beta");

    beta.DeleteSession("alpha");
    assert(beta.ListSessions().size() == 1);
    assert(beta.Size() == 1);

    beta.Clear();
    assert(beta.Size() == 0);
    assert(beta.ListSessions().empty());
    assert(beta.GetOrCreateToken("EMAIL", "x@y.com") == FormatToken("EMAIL", 1));
  }

  {
    SqliteVault alpha("alpha", db.string());
    assert(alpha.Size() == 0);
  }

  {
    SqliteVault vault("gamma", db.string());
    vault.Close();
    assert(!vault.IsOpen());
    bool threw = false;
    try {
      (void)vault.GetOrCreateToken("EMAIL", "a@b.com");
    } catch (const StorageError&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      (void)vault.Size();
    } catch (const StorageError&) {
      threw = true;
    }
    assert(threw);
  }

  {
    SqliteVault mem("solo", ":memory:");
    assert(mem.GetOrCreateToken("PHONE", "0412 345 678") == FormatToken("PHONE", 1));
  }

  RemoveDb(db);
  std::filesystem::remove_all(dir);
  return 0;
}
