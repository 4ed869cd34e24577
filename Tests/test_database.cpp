/**
 * @file test_database.cpp
 * @brief Unit tests for DatabaseManager, TransactionGuard and the identity schema
 */

#include "TestUtils.h"

extern "C" {
#ifdef SQLCIPHER_AVAILABLE
#include <sqlcipher/sqlite3.h>
#else
#include <sqlite3.h>
#endif
}

#include <stdexcept>

constexpr const char* TEST_DB_PATH = "test_database.db";

namespace {

int countRows(Database::DatabaseManager& db, const std::string& table) {
    auto lock = db.acquireLock();
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = "SELECT COUNT(*) FROM " + table;
    if (sqlite3_prepare_v2(db.getHandle(), sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    int count = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : -1;
    sqlite3_finalize(stmt);
    return count;
}

} // namespace

// ============================================================================
// Test Cases
// ============================================================================

static bool testInitializeRejectsBadArguments() {
    TEST_START("Initialize - Rejects Bad Arguments");

    Database::DatabaseManager db;
    auto emptyPath = db.initialize("");
    TEST_ASSERT(!emptyPath.success, "Empty path should be rejected");

    auto weakKey = db.initialize("test_weak_key.db", "short-key");
    TEST_ASSERT(!weakKey.success, "Keys shorter than 32 characters should be rejected");
    TEST_ASSERT(!db.isInitialized(), "Manager should stay closed");

    TEST_PASS();
}

static bool testSchemaApplied(Database::DatabaseManager& db) {
    TEST_START("Open Identity Store - Schema Applied");

    TEST_ASSERT(db.isInitialized(), "Database should be open");
    TEST_ASSERT(db.getSchemaVersion() == 1, "Schema should be at version 1");

    TEST_ASSERT(countRows(db, "users") == 0, "users table should exist and be empty");
    TEST_ASSERT(countRows(db, "sessions") == 0, "sessions table should exist");
    TEST_ASSERT(countRows(db, "login_attempts") == 0, "login_attempts table should exist");
    TEST_ASSERT(countRows(db, "password_resets") == 0, "password_resets table should exist");

    TEST_PASS();
}

static bool testMigrationsAreIdempotent(Database::DatabaseManager& db) {
    TEST_START("Run Migrations - Idempotent and Appendable");

    auto again = db.runMigrations(Database::authSchemaMigrations());
    TEST_ASSERT(again.success, "Re-running applied migrations should succeed");
    TEST_ASSERT(db.getSchemaVersion() == 1, "Version should not change");

    std::vector<Database::Migration> extended = Database::authSchemaMigrations();
    extended.emplace_back(2, "Add audit table", "CREATE TABLE audit_notes (note TEXT);");
    auto upgraded = db.runMigrations(extended);
    TEST_ASSERT(upgraded.success, "New migration should apply");
    TEST_ASSERT(db.getSchemaVersion() == 2, "Version should advance to 2");
    TEST_ASSERT(countRows(db, "audit_notes") == 0, "New table should exist");

    std::vector<Database::Migration> broken = extended;
    broken.emplace_back(3, "Broken migration", "CREATE TABLE broken (;");
    auto failed = db.runMigrations(broken);
    TEST_ASSERT(!failed.success, "Invalid SQL should fail the migration");
    TEST_ASSERT(db.getSchemaVersion() == 2, "Failed migration should not bump the version");
    TEST_ASSERT(!db.inTransaction(), "Failed migration should not leave a transaction open");

    TEST_PASS();
}

static bool testTransactionGuardRollsBack(Database::DatabaseManager& db,
                                          Repository::UserRepository& userRepo) {
    TEST_START("Transaction Guard - Rolls Back Without Commit");

    int before = countRows(db, "users");
    {
        Database::TransactionGuard guard(db);
        TEST_ASSERT(db.inTransaction(), "Guard should open a transaction");
        TEST_ASSERT(!TestUtils::createTestUser(userRepo, "rolled_back").empty(),
                    "Insert inside the transaction should succeed");
        TEST_ASSERT(countRows(db, "users") == before + 1, "Row is visible inside the transaction");
    }
    TEST_ASSERT(!db.inTransaction(), "Guard should close the transaction");
    TEST_ASSERT(countRows(db, "users") == before, "Row should be gone after rollback");

    TEST_PASS();
}

static bool testTransactionGuardCommits(Database::DatabaseManager& db,
                                        Repository::UserRepository& userRepo) {
    TEST_START("Transaction Guard - Commit Persists");

    int before = countRows(db, "users");
    {
        Database::TransactionGuard guard(db);
        TEST_ASSERT(!TestUtils::createTestUser(userRepo, "committed").empty(), "Insert should succeed");
        guard.commit();
    }
    TEST_ASSERT(countRows(db, "users") == before + 1, "Committed row should remain");

    TEST_PASS();
}

static bool testNestedTransactionRejected(Database::DatabaseManager& db) {
    TEST_START("Transaction Guard - Nested Begin Rejected");

    Database::TransactionGuard outer(db);
    bool threw = false;
    try {
        Database::TransactionGuard inner(db);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "A second guard on the same connection should throw");
    TEST_ASSERT(db.inTransaction(), "The outer transaction should still be open");

    TEST_PASS();
}

static bool testBusyErrorClassification() {
    TEST_START("Busy Error Classification");

    TEST_ASSERT(Database::DatabaseManager::isBusyError(SQLITE_BUSY), "SQLITE_BUSY is busy");
    TEST_ASSERT(Database::DatabaseManager::isBusyError(SQLITE_LOCKED), "SQLITE_LOCKED is busy");
    TEST_ASSERT(Database::DatabaseManager::isBusyError(SQLITE_BUSY | (2 << 8)),
                "Extended busy codes are busy");
    TEST_ASSERT(!Database::DatabaseManager::isBusyError(SQLITE_CONSTRAINT), "Constraint is not busy");
    TEST_ASSERT(!Database::DatabaseManager::isBusyError(SQLITE_ERROR), "Generic error is not busy");

    TEST_PASS();
}

static bool testReopenKeepsData() {
    TEST_START("Reopen - Data and Version Survive");

    const std::string path = "test_database_reopen.db";
    {
        Database::DatabaseManager db;
        TEST_ASSERT(TestUtils::initializeTestDatabase(db, path), "Initial open should succeed");
        Repository::UserRepository userRepo(db);
        TEST_ASSERT(!TestUtils::createTestUser(userRepo, "persisted").empty(), "Insert should succeed");
    }

    Database::DatabaseManager db;
    auto reopened = Database::openAuthDatabase(db, path, STANDARD_TEST_ENCRYPTION_KEY);
    TEST_ASSERT(reopened.success, "Reopen should succeed");
    TEST_ASSERT(db.getSchemaVersion() == 1, "Version should be preserved");

    Repository::UserRepository userRepo(db);
    TEST_ASSERT(userRepo.findByIdentifier("persisted").hasValue(), "User should survive reopen");

    db.close();
    TestUtils::cleanupTestDatabase(path);

    TEST_PASS();
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    TestUtils::printTestHeader("DatabaseManager Unit Tests");
    TestUtils::initializeTestLogger("test_database.log");

    testInitializeRejectsBadArguments();
    testBusyErrorClassification();

    Database::DatabaseManager db;
    if (!TestUtils::initializeTestDatabase(db, TEST_DB_PATH)) {
        std::cerr << COLOR_RED << "Failed to initialize test environment" << COLOR_RESET << std::endl;
        return 1;
    }
    Repository::UserRepository userRepo(db);

    testSchemaApplied(db);
    testTransactionGuardRollsBack(db, userRepo);
    testTransactionGuardCommits(db, userRepo);
    testNestedTransactionRejected(db);
    testMigrationsAreIdempotent(db);
    testReopenKeepsData();

    TestUtils::shutdownTestEnvironment(db, TEST_DB_PATH);
    TestUtils::printTestSummary("DatabaseManager Test");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
