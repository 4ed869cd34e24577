#pragma once

#include "DatabaseManager.h"
#include <vector>

namespace Database {

/**
 * @brief Versioned schema for the identity store, applied by runMigrations()
 *
 * Version 1 creates users, sessions, login_attempts and password_resets.
 * New versions are appended; existing entries are never edited.
 */
const std::vector<Migration>& authSchemaMigrations();

/**
 * @brief Open the database and bring its schema up to date
 */
DatabaseResult openAuthDatabase(DatabaseManager& db, const std::string& dbPath,
                                const std::string& encryptionKey = "");

} // namespace Database
