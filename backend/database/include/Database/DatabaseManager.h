#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declaration to avoid including SQLite headers in the header
struct sqlite3;

namespace Database {

/**
 * @brief Result structure for database operations
 */
struct DatabaseResult {
    bool success;
    std::string message;
    int errorCode;

    DatabaseResult(bool s = false, const std::string& msg = "", int errCode = 0)
        : success(s), message(msg), errorCode(errCode) {}

    operator bool() const { return success; }
};

/**
 * @brief Database migration information
 */
struct Migration {
    int version;
    std::string description;
    std::string sql;

    Migration(int v, const std::string& desc, const std::string& query)
        : version(v), description(desc), sql(query) {}
};

/**
 * @brief Owner of the local SQLite connection used by the identity store
 *
 * This class provides:
 * - A single serialized connection (optionally SQLCipher-encrypted)
 * - Schema versioning and migrations
 * - Transaction management
 * - Thread-safe operations through a recursive connection lock
 *
 * Repositories that prepare their own statements must hold acquireLock()
 * from prepare to finalize so that sqlite3_changes() and error messages
 * belong to their own statement.
 */
class DatabaseManager {
public:
    DatabaseManager();
    ~DatabaseManager();

    // Prevent copying
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Open (and create if needed) the database
     * @param dbPath Path to the database file
     * @param encryptionKey SQLCipher key; empty for an unencrypted store
     * @return DatabaseResult indicating success or failure
     */
    DatabaseResult initialize(const std::string& dbPath, const std::string& encryptionKey = "");

    /**
     * @brief Close the database connection
     */
    void close();

    /**
     * @brief Check if database is initialized and connected
     * @return true if database is ready for operations
     */
    bool isInitialized() const;

    /**
     * @brief Execute one or more SQL statements without parameters
     * @param sql SQL to execute
     * @return DatabaseResult indicating success or failure
     */
    DatabaseResult executeQuery(const std::string& sql);

    /**
     * @brief Begin a database transaction (BEGIN IMMEDIATE)
     */
    DatabaseResult beginTransaction();

    /**
     * @brief Commit the current transaction
     */
    DatabaseResult commitTransaction();

    /**
     * @brief Rollback the current transaction
     */
    DatabaseResult rollbackTransaction();

    bool inTransaction() const;

    /**
     * @brief Get the current database schema version
     * @return Schema version number, -1 if error
     */
    int getSchemaVersion();

    /**
     * @brief Set the database schema version
     * @param version New schema version
     * @return DatabaseResult indicating success or failure
     */
    DatabaseResult setSchemaVersion(int version);

    /**
     * @brief Run database migrations to upgrade schema
     * @param migrations Vector of migrations to apply, ordered by version
     * @return DatabaseResult indicating success or failure
     */
    DatabaseResult runMigrations(const std::vector<Migration>& migrations);

    /**
     * @brief Get the SQLite handle (use with caution, under acquireLock())
     * @return Raw SQLite3 database handle
     */
    sqlite3* getHandle();

    /**
     * @brief Lock the connection for a multi-call statement sequence
     */
    std::unique_lock<std::recursive_mutex> acquireLock() const;

    /**
     * @brief Whether an SQLite result code means the store was busy or locked
     */
    static bool isBusyError(int errorCode);

private:
    /**
     * @brief Create the schema_version bookkeeping table for a new database
     */
    DatabaseResult createInitialSchema();

    /**
     * @brief Validate that the database can be read with the supplied key
     */
    DatabaseResult validateEncryption();

    /**
     * @brief Setup database pragmas for integrity and concurrency
     */
    DatabaseResult setupPragmas();

    /**
     * @brief Run a statement without taking the lock or logging it
     */
    DatabaseResult execRaw(const std::string& sql, const std::string& context);

private:
    sqlite3* m_db;
    std::string m_dbPath;
    std::string m_encryptionKey;  // Wiped on close()
    bool m_initialized;
    mutable std::recursive_mutex m_mutex;
    bool m_inTransaction;

    // Constants
    static constexpr int BUSY_TIMEOUT_MS = 5000;
    static constexpr const char* SCHEMA_VERSION_TABLE = "schema_version";
    static constexpr const char* COMPONENT_NAME = "DatabaseManager";
};

/**
 * @brief RAII transaction guard for automatic rollback on scope exit
 *
 * Holds the connection lock for its whole lifetime, so statements issued by
 * other threads cannot interleave with the transaction.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(DatabaseManager& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    /**
     * @brief Commit the transaction (prevents automatic rollback)
     */
    void commit();

private:
    DatabaseManager& m_db;
    std::unique_lock<std::recursive_mutex> m_lock;
    bool m_committed;
};

} // namespace Database
