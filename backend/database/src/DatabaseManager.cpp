#include "../include/Database/DatabaseManager.h"
#include "Repository/Logger.h"
#ifdef SQLCIPHER_AVAILABLE
#define SQLITE_HAS_CODEC 1
#include <sqlcipher/sqlite3.h>
#else
#include <sqlite3.h>
#endif
#include <sodium.h>
#include <stdexcept>

namespace Database {

namespace {
void secureZeroMemory(void *ptr, size_t size) { sodium_memzero(ptr, size); }

std::string describeError(sqlite3 *db, char *errorMsg) {
  std::string error;
  if (errorMsg) {
    error = errorMsg;
    sqlite3_free(errorMsg);
  } else if (db) {
    error = sqlite3_errmsg(db);
  }
  return error;
}
} // namespace

DatabaseManager::DatabaseManager()
    : m_db(nullptr), m_initialized(false), m_inTransaction(false) {}

DatabaseManager::~DatabaseManager() { close(); }

DatabaseResult DatabaseManager::initialize(const std::string &dbPath,
                                           const std::string &encryptionKey) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (m_initialized) {
    return DatabaseResult(true, "Database already initialized");
  }

  if (dbPath.empty()) {
    return DatabaseResult(false, "Database path must not be empty",
                          SQLITE_MISUSE);
  }

  // Validate encryption key strength
  if (!encryptionKey.empty() && encryptionKey.length() < 32) {
    return DatabaseResult(false,
                          "Encryption key must be at least 32 characters long",
                          SQLITE_MISUSE);
  }

  m_dbPath = dbPath;
  m_encryptionKey = encryptionKey;
  m_inTransaction = false;

  // Open the database with full mutex to avoid cross-thread issues
  int result = sqlite3_open_v2(
      dbPath.c_str(), &m_db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  if (result != SQLITE_OK) {
    std::string error = "Failed to open database: " +
                        std::string(m_db ? sqlite3_errmsg(m_db) : "out of memory");
    if (m_db) {
      sqlite3_close(m_db);
      m_db = nullptr;
    }
    REPO_LOG_ERROR(COMPONENT_NAME, "Open failed", error);
    return DatabaseResult(false, error, result);
  }

#ifdef SQLCIPHER_AVAILABLE
  if (!m_encryptionKey.empty()) {
    result = sqlite3_key(m_db, m_encryptionKey.c_str(),
                         static_cast<int>(m_encryptionKey.size()));
    if (result != SQLITE_OK) {
      std::string error =
          "Failed to set encryption key: " + std::string(sqlite3_errmsg(m_db));
      sqlite3_close(m_db);
      m_db = nullptr;
      return DatabaseResult(false, error, result);
    }

    result = sqlite3_exec(m_db, "PRAGMA cipher_page_size = 4096;", nullptr,
                          nullptr, nullptr);
    if (result == SQLITE_OK) {
      result = sqlite3_exec(m_db, "PRAGMA kdf_iter = 256000;", nullptr,
                            nullptr, nullptr);
    }
    if (result != SQLITE_OK) {
      std::string error = "Failed to configure cipher: " +
                          std::string(sqlite3_errmsg(m_db));
      sqlite3_close(m_db);
      m_db = nullptr;
      return DatabaseResult(false, error, result);
    }
  }
#else
  if (!m_encryptionKey.empty()) {
    REPO_LOG_WARNING(COMPONENT_NAME,
                     "Encryption key supplied but SQLCipher is not available",
                     "Path: " + dbPath);
  }
#endif

  sqlite3_busy_timeout(m_db, BUSY_TIMEOUT_MS);

  // Validate encryption by trying to read from the database
  auto validationResult = validateEncryption();
  if (!validationResult) {
    sqlite3_close(m_db);
    m_db = nullptr;
    return validationResult;
  }

  auto pragmaResult = setupPragmas();
  if (!pragmaResult) {
    sqlite3_close(m_db);
    m_db = nullptr;
    return pragmaResult;
  }

  // Create initial schema if this is a new database
  auto schemaResult = createInitialSchema();
  if (!schemaResult) {
    sqlite3_close(m_db);
    m_db = nullptr;
    return schemaResult;
  }

  m_initialized = true;
  REPO_LOG_INFO(COMPONENT_NAME, "Database opened", "Path: " + dbPath);
  return DatabaseResult(true, "Database initialized successfully");
}

void DatabaseManager::close() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (m_db) {
    // Rollback any pending transactions
    if (m_inTransaction) {
      sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
      m_inTransaction = false;
    }

    sqlite3_close(m_db);
    m_db = nullptr;
  }

  m_initialized = false;

  // Clear encryption key from memory securely
  if (!m_encryptionKey.empty()) {
    secureZeroMemory(&m_encryptionKey[0], m_encryptionKey.size());
    m_encryptionKey.clear();
  }
}

bool DatabaseManager::isInitialized() const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_initialized && m_db != nullptr;
}

DatabaseResult DatabaseManager::execRaw(const std::string &sql,
                                        const std::string &context) {
  char *errorMsg = nullptr;
  int result = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errorMsg);
  if (result != SQLITE_OK) {
    return DatabaseResult(false, context + ": " + describeError(m_db, errorMsg),
                          result);
  }
  return DatabaseResult(true, context);
}

DatabaseResult DatabaseManager::executeQuery(const std::string &sql) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (!m_db) {
    return DatabaseResult(false, "Database not opened", SQLITE_MISUSE);
  }

  auto result = execRaw(sql, "SQL execution");
  if (!result) {
    REPO_LOG_ERROR(COMPONENT_NAME, "Query failed", result.message);
    return result;
  }

  return DatabaseResult(true, "Query executed successfully");
}

DatabaseResult DatabaseManager::beginTransaction() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (!m_initialized || !m_db) {
    return DatabaseResult(false, "Database not initialized", SQLITE_MISUSE);
  }

  if (m_inTransaction) {
    return DatabaseResult(false, "Transaction already in progress",
                          SQLITE_MISUSE);
  }

  auto result = execRaw("BEGIN IMMEDIATE;", "Failed to begin transaction");
  if (!result) {
    return result;
  }

  m_inTransaction = true;
  return DatabaseResult(true, "Transaction started");
}

DatabaseResult DatabaseManager::commitTransaction() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (!m_initialized || !m_db) {
    return DatabaseResult(false, "Database not initialized", SQLITE_MISUSE);
  }

  if (!m_inTransaction) {
    return DatabaseResult(false, "No transaction in progress", SQLITE_MISUSE);
  }

  auto result = execRaw("COMMIT;", "Failed to commit transaction");
  if (!result) {
    return result;
  }

  m_inTransaction = false;
  return DatabaseResult(true, "Transaction committed");
}

DatabaseResult DatabaseManager::rollbackTransaction() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (!m_initialized || !m_db) {
    return DatabaseResult(false, "Database not initialized", SQLITE_MISUSE);
  }

  if (!m_inTransaction) {
    return DatabaseResult(false, "No transaction in progress", SQLITE_MISUSE);
  }

  auto result = execRaw("ROLLBACK;", "Failed to rollback transaction");

  // A failed ROLLBACK means SQLite already ended the transaction
  m_inTransaction = false;
  return result ? DatabaseResult(true, "Transaction rolled back") : result;
}

bool DatabaseManager::inTransaction() const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_inTransaction;
}

int DatabaseManager::getSchemaVersion() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (!m_db) {
    return -1;
  }

  sqlite3_stmt *stmt = nullptr;
  std::string sql =
      "SELECT version FROM " + std::string(SCHEMA_VERSION_TABLE) + " LIMIT 1;";
  int result = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);

  if (result != SQLITE_OK) {
    return 0; // Assume version 0 if table doesn't exist
  }

  result = sqlite3_step(stmt);
  int version = 0;

  if (result == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  } else if (result != SQLITE_DONE) {
    version = -1;
  }

  sqlite3_finalize(stmt);
  return version;
}

DatabaseResult DatabaseManager::setSchemaVersion(int version) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (!m_db) {
    return DatabaseResult(false, "Database not opened", SQLITE_MISUSE);
  }

  std::string sql = "INSERT OR REPLACE INTO " +
                    std::string(SCHEMA_VERSION_TABLE) +
                    " (id, version) VALUES (1, ?);";

  sqlite3_stmt *stmt = nullptr;
  int result = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);

  if (result != SQLITE_OK) {
    std::string error = "Failed to prepare version update: " +
                        std::string(sqlite3_errmsg(m_db));
    return DatabaseResult(false, error, result);
  }

  sqlite3_bind_int(stmt, 1, version);

  result = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  if (result != SQLITE_DONE) {
    std::string error =
        "Failed to update schema version: " + std::string(sqlite3_errmsg(m_db));
    return DatabaseResult(false, error, result);
  }

  return DatabaseResult(true,
                        "Schema version updated to " + std::to_string(version));
}

DatabaseResult
DatabaseManager::runMigrations(const std::vector<Migration> &migrations) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  int currentVersion = getSchemaVersion();
  if (currentVersion < 0) {
    return DatabaseResult(false, "Unable to read schema version", SQLITE_ERROR);
  }

  auto abandon = [this](const std::string &reason) {
    auto rollback = rollbackTransaction();
    if (!rollback) {
      REPO_LOG_ERROR(COMPONENT_NAME, "Migration rollback failed",
                     reason + "; " + rollback.message);
    }
  };

  for (const auto &migration : migrations) {
    if (migration.version <= currentVersion) {
      continue; // Skip already applied migrations
    }

    REPO_LOG_INFO(COMPONENT_NAME,
                  "Applying migration " + std::to_string(migration.version),
                  migration.description);

    auto transactionResult = beginTransaction();
    if (!transactionResult) {
      return transactionResult;
    }

    auto migrationResult = executeQuery(migration.sql);
    if (!migrationResult) {
      abandon(migrationResult.message);
      return DatabaseResult(false,
                            "Migration " + std::to_string(migration.version) +
                                " failed: " + migrationResult.message,
                            migrationResult.errorCode);
    }

    auto versionResult = setSchemaVersion(migration.version);
    if (!versionResult) {
      abandon(versionResult.message);
      return versionResult;
    }

    auto commitResult = commitTransaction();
    if (!commitResult) {
      abandon(commitResult.message);
      return commitResult;
    }

    currentVersion = migration.version;
  }

  return DatabaseResult(true, "All migrations applied successfully");
}

sqlite3 *DatabaseManager::getHandle() { return m_db; }

std::unique_lock<std::recursive_mutex> DatabaseManager::acquireLock() const {
  return std::unique_lock<std::recursive_mutex>(m_mutex);
}

bool DatabaseManager::isBusyError(int errorCode) {
  int primary = errorCode & 0xFF;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

DatabaseResult DatabaseManager::createInitialSchema() {
  std::string createVersionTable =
      "CREATE TABLE IF NOT EXISTS " + std::string(SCHEMA_VERSION_TABLE) +
      " ("
      "id INTEGER PRIMARY KEY CHECK (id = 1), "
      "version INTEGER NOT NULL, "
      "updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
      ");"
      "INSERT OR IGNORE INTO " +
      std::string(SCHEMA_VERSION_TABLE) + " (id, version) VALUES (1, 0);";

  auto result = execRaw(createVersionTable, "Failed to create schema_version table");
  if (!result) {
    return result;
  }

  return DatabaseResult(true, "Initial schema created successfully");
}

DatabaseResult DatabaseManager::validateEncryption() {
  // Try to read from sqlite_master to verify the key (if any) is correct
  sqlite3_stmt *stmt = nullptr;
  int result = sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM sqlite_master;",
                                  -1, &stmt, nullptr);

  if (result != SQLITE_OK) {
    std::string error = "Database encryption validation failed: " +
                        std::string(sqlite3_errmsg(m_db));
    return DatabaseResult(false, error, result);
  }

  result = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  if (result != SQLITE_ROW) {
    return DatabaseResult(false, "Failed to validate database encryption",
                          result);
  }

  return DatabaseResult(true, "Database encryption validated");
}

DatabaseResult DatabaseManager::setupPragmas() {
  // Enable foreign key constraints
  auto result = execRaw("PRAGMA foreign_keys = ON;", "foreign_keys");
  if (!result)
    return result;

  // Set secure delete to overwrite deleted data
  result = execRaw("PRAGMA secure_delete = ON;", "secure_delete");
  if (!result)
    return result;

  // WAL lets readers proceed while a writer holds the database
  result = execRaw("PRAGMA journal_mode = WAL;", "journal_mode");
  if (!result)
    return result;

  result = execRaw("PRAGMA synchronous = FULL;", "synchronous");
  if (!result)
    return result;

  return DatabaseResult(true, "Database pragmas configured successfully");
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(DatabaseManager &db)
    : m_db(db), m_lock(db.acquireLock()), m_committed(false) {
  auto result = m_db.beginTransaction();
  if (!result) {
    throw std::runtime_error("Failed to begin transaction: " + result.message);
  }
}

TransactionGuard::~TransactionGuard() {
  if (!m_committed) {
    auto result = m_db.rollbackTransaction();
    if (!result) {
      REPO_LOG_ERROR("TransactionGuard", "Rollback failed", result.message);
    }
  }
}

void TransactionGuard::commit() {
  auto result = m_db.commitTransaction();
  if (!result) {
    throw std::runtime_error("Failed to commit transaction: " + result.message);
  }
  m_committed = true;
}

} // namespace Database
