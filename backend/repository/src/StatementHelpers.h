#pragma once

#include "Database/DatabaseManager.h"
#include "Repository/RepositoryTypes.h"
#include <string>

#ifdef SQLCIPHER_AVAILABLE
#define SQLITE_HAS_CODEC 1
#include <sqlcipher/sqlite3.h>
#else
#include <sqlite3.h>
#endif

// Shared by the repository sources only; not part of the public headers.
namespace Repository {
namespace detail {

inline std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

inline int storageErrorCode(int rc) {
    return Database::DatabaseManager::isBusyError(rc) ? ErrorCode::BUSY : ErrorCode::STORAGE;
}

inline std::string storageError(sqlite3* db, const std::string& context) {
    return context + ": " + (db ? sqlite3_errmsg(db) : "no connection");
}

} // namespace detail
} // namespace Repository
