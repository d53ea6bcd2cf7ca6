#include "persistence/SQLiteStore.hpp"
#include "core/Logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>

namespace Tether {

namespace {
    // Database schema version
    constexpr int SCHEMA_VERSION = 1;

    const char* SQL_CREATE_KV = R"(
        CREATE TABLE IF NOT EXISTS kv (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            modified_at INTEGER NOT NULL
        );
    )";

    const char* SQL_CREATE_METADATA = R"(
        CREATE TABLE IF NOT EXISTS metadata (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";
}

SQLiteStore::SQLiteStore() = default;

SQLiteStore::SQLiteStore(Config config)
    : m_config(std::move(config)) {}

SQLiteStore::~SQLiteStore() {
    Close();
}

std::expected<void, StoreError> SQLiteStore::Open() {
    std::lock_guard<std::mutex> lock(m_dbMutex);

    if (m_db) {
        TETHER_LOG_WARN("SQLiteStore already open");
        return {};
    }

    std::filesystem::path dbPath(m_config.databasePath);
    if (dbPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            TETHER_LOG_ERROR("Failed to create database directory: {}", ec.message());
            return std::unexpected(StoreError::AccessDenied);
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(m_config.databasePath.c_str(), &m_db, flags, nullptr);

    if (result != SQLITE_OK) {
        TETHER_LOG_ERROR("Failed to open SQLite database: {}", m_db ? sqlite3_errmsg(m_db) : "out of memory");
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        return std::unexpected(StoreError::IoError);
    }

    if (m_config.enableWAL) {
        ExecuteStatement("PRAGMA journal_mode=WAL;");
    }
    ExecuteStatement("PRAGMA busy_timeout=" + std::to_string(m_config.busyTimeout) + ";");
    ExecuteStatement(m_config.fullSync ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

    if (!CreateSchema()) {
        sqlite3_close(m_db);
        m_db = nullptr;
        return std::unexpected(StoreError::Corrupted);
    }

    TETHER_LOG_INFO("SQLite store opened: {}", m_config.databasePath);
    return {};
}

void SQLiteStore::Close() {
    std::lock_guard<std::mutex> lock(m_dbMutex);
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        TETHER_LOG_DEBUG("SQLite store closed: {}", m_config.databasePath);
    }
}

bool SQLiteStore::IsOpen() const {
    std::lock_guard<std::mutex> lock(m_dbMutex);
    return m_db != nullptr;
}

bool SQLiteStore::CreateSchema() {
    if (!ExecuteStatement(SQL_CREATE_METADATA)) return false;

    int currentVersion = 0;
    if (sqlite3_stmt* stmt = PrepareStatement("SELECT value FROM metadata WHERE key='schema_version';")) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* value = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            currentVersion = value ? std::atoi(value) : 0;
        }
        sqlite3_finalize(stmt);
    }

    if (currentVersion == SCHEMA_VERSION) {
        return true;
    }

    if (currentVersion > SCHEMA_VERSION) {
        TETHER_LOG_ERROR("Database schema version {} is newer than supported version {}",
                         currentVersion, SCHEMA_VERSION);
        return false;
    }

    TETHER_LOG_INFO("Creating store schema version {}", SCHEMA_VERSION);
    if (!ExecuteStatement(SQL_CREATE_KV)) return false;

    return ExecuteStatement("INSERT OR REPLACE INTO metadata (key, value) VALUES ('schema_version', '" +
                            std::to_string(SCHEMA_VERSION) + "');");
}

std::optional<std::string> SQLiteStore::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_dbMutex);
    if (!m_db) {
        TETHER_LOG_ERROR("SQLiteStore not open");
        return std::nullopt;
    }

    sqlite3_stmt* stmt = PrepareStatement("SELECT value FROM kv WHERE key=?");
    if (!stmt) return std::nullopt;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* value = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        result = value ? std::string(value) : std::string();
    }

    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::Set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_dbMutex);
    if (!m_db) {
        TETHER_LOG_ERROR("SQLiteStore not open");
        return false;
    }

    sqlite3_stmt* stmt = PrepareStatement(
        "INSERT INTO kv (key, value, modified_at) VALUES (?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value=excluded.value, modified_at=excluded.modified_at");
    if (!stmt) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(GetCurrentTimestamp()));

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        TETHER_LOG_ERROR("Failed to store key {}: {}", key, sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool SQLiteStore::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_dbMutex);
    if (!m_db) {
        TETHER_LOG_ERROR("SQLiteStore not open");
        return false;
    }

    sqlite3_stmt* stmt = PrepareStatement("DELETE FROM kv WHERE key=?");
    if (!stmt) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        TETHER_LOG_ERROR("Failed to remove key {}: {}", key, sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::vector<std::string> SQLiteStore::Keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(m_dbMutex);

    std::vector<std::string> keys;
    if (!m_db) {
        return keys;
    }

    sqlite3_stmt* stmt = PrepareStatement(
        "SELECT key FROM kv WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key ASC");
    if (!stmt) return keys;

    sqlite3_bind_text(stmt, 1, prefix.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (key) {
            keys.emplace_back(key);
        }
    }

    sqlite3_finalize(stmt);
    return keys;
}

bool SQLiteStore::ExecuteStatement(const std::string& sql) {
    char* error = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        TETHER_LOG_ERROR("SQL execution failed: {}", error ? error : sqlite3_errmsg(m_db));
        sqlite3_free(error);
        return false;
    }
    return true;
}

sqlite3_stmt* SQLiteStore::PrepareStatement(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    int result = sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr);

    if (result != SQLITE_OK) {
        TETHER_LOG_ERROR("Failed to prepare SQL statement: {}", sqlite3_errmsg(m_db));
        return nullptr;
    }

    return stmt;
}

uint64_t SQLiteStore::GetCurrentTimestamp() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace Tether
