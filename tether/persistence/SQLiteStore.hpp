#pragma once

#include "IDurableStore.hpp"
#include <sqlite3.h>
#include <expected>
#include <mutex>

namespace Tether {

/**
 * @brief SQLite-backed durable key/value store
 *
 * Features:
 * - Single "kv" table keyed by string
 * - Write-Ahead Logging and busy timeout for concurrent readers
 * - Schema version stored in a metadata table
 */
class SQLiteStore : public IDurableStore {
public:
    struct Config {
        std::string databasePath = "tether_store.db";
        bool enableWAL = true;              // Write-Ahead Logging for better concurrency
        int busyTimeout = 5000;             // Timeout for locked database (ms)
        bool fullSync = false;              // synchronous=FULL instead of NORMAL
    };

    SQLiteStore();
    explicit SQLiteStore(Config config);
    ~SQLiteStore() override;

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    /**
     * @brief Open the database and create the schema if needed
     */
    std::expected<void, StoreError> Open();

    /**
     * @brief Close the database; safe to call repeatedly
     */
    void Close();

    [[nodiscard]] bool IsOpen() const;

    std::optional<std::string> Get(const std::string& key) override;
    bool Set(const std::string& key, const std::string& value) override;
    bool Remove(const std::string& key) override;
    std::vector<std::string> Keys(const std::string& prefix = "") override;

    [[nodiscard]] const Config& GetConfig() const { return m_config; }

private:
    bool CreateSchema();
    bool ExecuteStatement(const std::string& sql);
    sqlite3_stmt* PrepareStatement(const char* sql);
    uint64_t GetCurrentTimestamp() const;

    Config m_config;
    sqlite3* m_db = nullptr;
    mutable std::mutex m_dbMutex;
};

} // namespace Tether
