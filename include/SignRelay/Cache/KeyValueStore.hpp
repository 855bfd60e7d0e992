#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Clock.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace SQLite {
  class Database;
} // namespace SQLite

namespace signrelay::cache {
  namespace {
    using utils::types::Mutex;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::UniquePointer;
    using utils::types::UnorderedMap;
  } // namespace

  /**
   * @class IKeyValueStore
   * @brief Durable blob storage addressed by namespace.
   *
   * Each content cache owns one namespace and rewrites its whole blob on every
   * change. A missing namespace is not an error: `get` returns None.
   */
  class IKeyValueStore {
   public:
    IKeyValueStore(const IKeyValueStore&) = delete;
    IKeyValueStore(IKeyValueStore&&)      = delete;

    fn operator=(const IKeyValueStore&)->IKeyValueStore& = delete;
    fn operator=(IKeyValueStore&&)->IKeyValueStore&      = delete;

    virtual ~IKeyValueStore() = default;

    [[nodiscard]] virtual fn get(StringView nameSpace) -> Result<Option<String>> = 0;

    virtual fn set(StringView nameSpace, const String& blob) -> Result<> = 0;

    virtual fn remove(StringView nameSpace) -> Result<> = 0;

   protected:
    IKeyValueStore() = default;
  };

  /**
   * @brief Process-local store. Contents survive cache re-construction but not the process.
   */
  class InMemoryStore final : public IKeyValueStore {
   public:
    InMemoryStore() = default;

    [[nodiscard]] fn get(StringView nameSpace) -> Result<Option<String>> override;
    fn set(StringView nameSpace, const String& blob) -> Result<> override;
    fn remove(StringView nameSpace) -> Result<> override;

   private:
    Mutex                        m_mutex;
    UnorderedMap<String, String> m_blobs;
  };

  /**
   * @class SqliteStore
   * @brief Stores each namespace as one row of a `kv` table in an SQLite database file.
   */
  class SqliteStore final : public IKeyValueStore {
    struct OpenTag {
      explicit OpenTag() = default;
    };

   public:
    /**
     * @brief Opens (creating if needed) the database and its `kv` table.
     * @param dbPath Path to the database file. Parent directories are created.
     * @param clock Source of the `updated_at` column.
     */
    static fn open(const std::filesystem::path& dbPath, SharedPointer<utils::clock::IClock> clock) -> Result<UniquePointer<SqliteStore>>;

    /**
     * @brief Only reachable through open().
     */
    SqliteStore(OpenTag tag, UniquePointer<SQLite::Database> database, SharedPointer<utils::clock::IClock> clock);

    ~SqliteStore() override;

    [[nodiscard]] fn get(StringView nameSpace) -> Result<Option<String>> override;
    fn set(StringView nameSpace, const String& blob) -> Result<> override;
    fn remove(StringView nameSpace) -> Result<> override;

   private:
    Mutex                               m_mutex;
    UniquePointer<SQLite::Database>     m_database;
    SharedPointer<utils::clock::IClock> m_clock;
  };

  /**
   * @brief Default database location: `$XDG_CACHE_HOME/signrelay/cache.db`,
   * falling back to `$HOME/.cache/signrelay/cache.db`, then the working directory.
   */
  fn DefaultStorePath() -> std::filesystem::path;
} // namespace signrelay::cache
