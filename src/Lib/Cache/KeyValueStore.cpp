#include "SignRelay/Cache/KeyValueStore.hpp"

#include <SQLiteCpp/Database.h>  // SQLite::{Database, OPEN_READWRITE, OPEN_CREATE}
#include <SQLiteCpp/Exception.h> // SQLite::Exception
#include <SQLiteCpp/Statement.h> // SQLite::Statement
#include <system_error>          // std::error_code

#include "SignRelay/Utils/Env.hpp"
#include "SignRelay/Utils/Logging.hpp"

namespace fs = std::filesystem;

using namespace signrelay::utils::types;
using signrelay::utils::clock::IClock;
using signrelay::utils::error::RelayError;
using enum signrelay::utils::error::RelayErrorCode;

namespace signrelay::cache {
  fn InMemoryStore::get(const StringView nameSpace) -> Result<Option<String>> {
    const LockGuard lock(m_mutex);

    if (const auto iter = m_blobs.find(String(nameSpace)); iter != m_blobs.end())
      return iter->second;

    return None;
  }

  fn InMemoryStore::set(const StringView nameSpace, const String& blob) -> Result<> {
    const LockGuard lock(m_mutex);
    m_blobs.insert_or_assign(String(nameSpace), blob);
    return {};
  }

  fn InMemoryStore::remove(const StringView nameSpace) -> Result<> {
    const LockGuard lock(m_mutex);
    m_blobs.erase(String(nameSpace));
    return {};
  }

  SqliteStore::SqliteStore(OpenTag /*tag*/, UniquePointer<SQLite::Database> database, SharedPointer<IClock> clock)
    : m_database(std::move(database)), m_clock(std::move(clock)) {}

  SqliteStore::~SqliteStore() = default;

  fn SqliteStore::open(const fs::path& dbPath, SharedPointer<IClock> clock) -> Result<UniquePointer<SqliteStore>> {
    if (dbPath.has_parent_path()) {
      std::error_code errc;
      fs::create_directories(dbPath.parent_path(), errc);

      if (errc)
        ERR_FMT(PersistenceFailure, "Failed to create cache directory '{}': {}", dbPath.parent_path().string(), errc.message());
    }

    try {
      auto database = std::make_unique<SQLite::Database>(dbPath.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);

      database->exec(
        "CREATE TABLE IF NOT EXISTS kv ("
        "  namespace  TEXT PRIMARY KEY,"
        "  blob       BLOB NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")"
      );

      debug_log("Opened cache store at {}", dbPath.string());

      return std::make_unique<SqliteStore>(OpenTag {}, std::move(database), std::move(clock));
    } catch (const SQLite::Exception& e) {
      ERR_FMT(PersistenceFailure, "SQLite error opening cache store '{}': {}", dbPath.string(), e.what());
    }
  }

  fn SqliteStore::get(const StringView nameSpace) -> Result<Option<String>> {
    const LockGuard lock(m_mutex);

    try {
      SQLite::Statement query(*m_database, "SELECT blob FROM kv WHERE namespace = ?");
      query.bind(1, String(nameSpace));

      if (!query.executeStep())
        return None;

      const SQLite::Column column = query.getColumn(0);

      return String(static_cast<const char*>(column.getBlob()), static_cast<usize>(column.getBytes()));
    } catch (const SQLite::Exception& e) {
      ERR_FMT(PersistenceFailure, "SQLite error reading namespace '{}': {}", nameSpace, e.what());
    }
  }

  fn SqliteStore::set(const StringView nameSpace, const String& blob) -> Result<> {
    const LockGuard lock(m_mutex);

    try {
      SQLite::Statement upsert(
        *m_database,
        "INSERT INTO kv (namespace, blob, updated_at) VALUES (?, ?, ?) "
        "ON CONFLICT(namespace) DO UPDATE SET blob = excluded.blob, updated_at = excluded.updated_at"
      );

      upsert.bind(1, String(nameSpace));
      upsert.bind(2, blob.data(), static_cast<i32>(blob.size()));
      upsert.bind(3, static_cast<i64>(m_clock->now()));
      upsert.exec();

      return {};
    } catch (const SQLite::Exception& e) {
      ERR_FMT(PersistenceFailure, "SQLite error writing namespace '{}': {}", nameSpace, e.what());
    }
  }

  fn SqliteStore::remove(const StringView nameSpace) -> Result<> {
    const LockGuard lock(m_mutex);

    try {
      SQLite::Statement erase(*m_database, "DELETE FROM kv WHERE namespace = ?");
      erase.bind(1, String(nameSpace));
      erase.exec();

      return {};
    } catch (const SQLite::Exception& e) {
      ERR_FMT(PersistenceFailure, "SQLite error removing namespace '{}': {}", nameSpace, e.what());
    }
  }

  fn DefaultStorePath() -> fs::path {
    using utils::env::GetEnv;

    if (const Result<PCStr> xdgCache = GetEnv("XDG_CACHE_HOME"))
      return fs::path(*xdgCache) / "signrelay" / "cache.db";

    if (const Result<PCStr> home = GetEnv("HOME"))
      return fs::path(*home) / ".cache" / "signrelay" / "cache.db";

    return fs::path(".") / "signrelay-cache.db";
  }
} // namespace signrelay::cache
