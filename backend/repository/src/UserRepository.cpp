#include "Repository/UserRepository.h"
#include "Crypto.h"
#include "StatementHelpers.h"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace Repository {

namespace {
const char* const USER_COLUMNS =
    "user_id, username, email, password_hash, salt, iterations, created_at, last_login, "
    "profile_fields, disabled";
}

UserRepository::UserRepository(Database::DatabaseManager& dbManager, Clock clock)
    : m_dbManager(dbManager), m_clock(std::move(clock)) {
    REPO_LOG_DEBUG(COMPONENT_NAME, "UserRepository initialized");
}

Result<User> UserRepository::createUser(const std::string& username, const std::string& email,
                                        const std::string& passwordHash,
                                        const std::vector<uint8_t>& salt, int iterations) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "createUser");

    if (username.empty() || email.empty() || passwordHash.empty() || salt.empty() || iterations <= 0) {
        return Result<User>("Username, email and password material are required", ErrorCode::BAD_REQUEST);
    }

    User user;
    try {
        user.userId = Crypto::GenerateSecureRandomString(USER_ID_BYTES);
    } catch (const std::exception& e) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Failed to generate user id", e.what());
        return Result<User>("Failed to generate user id", ErrorCode::STORAGE);
    }
    user.username = username;
    user.email = email;
    user.passwordHash = passwordHash;
    user.salt = salt;
    user.iterations = iterations;
    user.createdAt = fromUnixSeconds(toUnixSeconds(m_clock()));
    user.disabled = false;

    const std::string sql = R"(
        INSERT INTO users (user_id, username, email, password_hash, salt, iterations, created_at, profile_fields, disabled)
        VALUES (?, ?, ?, ?, ?, ?, ?, '{}', 0)
    )";

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Failed to prepare user insert", detail::storageError(db, "prepare"));
        return Result<User>("Failed to prepare user insertion statement", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, user.userId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, username.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, email.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, passwordHash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 5, salt.data(), static_cast<int>(salt.size()), SQLITE_STATIC);
    sqlite3_bind_int(stmt, 6, iterations);
    sqlite3_bind_int64(stmt, 7, toUnixSeconds(user.createdAt));

    rc = sqlite3_step(stmt);
    std::string errorText = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_DONE) {
        REPO_LOG_INFO(COMPONENT_NAME, "User created", "Username: " + username + ", ID: " + user.userId);
        return Result<User>(user);
    }

    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        if (errorText.find("users.username") != std::string::npos) {
            REPO_LOG_WARNING(COMPONENT_NAME, "Duplicate username rejected", "Username: " + username);
            return Result<User>(DUPLICATE_USERNAME, ErrorCode::CONFLICT);
        }
        if (errorText.find("users.email") != std::string::npos) {
            REPO_LOG_WARNING(COMPONENT_NAME, "Duplicate email rejected", "Username: " + username);
            return Result<User>(DUPLICATE_EMAIL, ErrorCode::CONFLICT);
        }
    }

    REPO_LOG_ERROR(COMPONENT_NAME, "User insert failed", errorText);
    return Result<User>("Failed to create user: database insertion failed", detail::storageErrorCode(rc));
}

Result<User> UserRepository::findByIdentifier(const std::string& identifier) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "findByIdentifier");

    if (identifier.empty()) {
        return Result<User>("Identifier is required", ErrorCode::BAD_REQUEST);
    }

    // Both columns are declared COLLATE NOCASE, so the comparison ignores case
    const std::string sql = std::string("SELECT ") + USER_COLUMNS +
                            " FROM users WHERE username = ?1 OR email = ?1 LIMIT 1";
    return fetchSingleUser(sql, identifier);
}

Result<User> UserRepository::getUserById(const std::string& userId) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "getUserById");

    const std::string sql = std::string("SELECT ") + USER_COLUMNS + " FROM users WHERE user_id = ?1";
    return fetchSingleUser(sql, userId);
}

Result<User> UserRepository::fetchSingleUser(const std::string& sql, const std::string& key) {
    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Failed to prepare user query", detail::storageError(db, "prepare"));
        return Result<User>("Failed to prepare user query", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        User user = mapRowToUser(stmt);
        sqlite3_finalize(stmt);
        return Result<User>(user);
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return Result<User>("User not found", ErrorCode::NOT_FOUND);
    } else {
        REPO_LOG_ERROR(COMPONENT_NAME, "User query failed", detail::storageError(db, "step"));
        sqlite3_finalize(stmt);
        return Result<User>("Database error while retrieving user", detail::storageErrorCode(rc));
    }
}

Result<bool> UserRepository::updatePassword(const std::string& userId, const std::string& passwordHash,
                                            const std::vector<uint8_t>& salt, int iterations) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "updatePassword");

    if (passwordHash.empty() || salt.empty() || iterations <= 0) {
        return Result<bool>("Password material is required", ErrorCode::BAD_REQUEST);
    }

    const std::string sql = R"(
        UPDATE users
        SET password_hash = ?, salt = ?, iterations = ?
        WHERE user_id = ?
    )";

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<bool>("Failed to prepare password update statement", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, passwordHash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 2, salt.data(), static_cast<int>(salt.size()), SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, iterations);
    sqlite3_bind_text(stmt, 4, userId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Password update failed", detail::storageError(db, "step"));
        return Result<bool>("Database error during password update", detail::storageErrorCode(rc));
    }

    if (sqlite3_changes(db) == 0) {
        return Result<bool>("User not found", ErrorCode::NOT_FOUND);
    }

    REPO_LOG_INFO(COMPONENT_NAME, "Password updated", "UserID: " + userId);
    return Result<bool>(true);
}

Result<bool> UserRepository::updateEmail(const std::string& userId, const std::string& email) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "updateEmail");

    if (userId.empty() || email.empty()) {
        return Result<bool>("User id and email are required", ErrorCode::BAD_REQUEST);
    }

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "UPDATE users SET email = ? WHERE user_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<bool>("Failed to prepare email update", detail::storageErrorCode(rc));
    }
    sqlite3_bind_text(stmt, 1, email.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, userId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    std::string errorText = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);

    if ((rc & 0xFF) == SQLITE_CONSTRAINT && errorText.find("users.email") != std::string::npos) {
        REPO_LOG_WARNING(COMPONENT_NAME, "Duplicate email rejected", "UserID: " + userId);
        return Result<bool>(DUPLICATE_EMAIL, ErrorCode::CONFLICT);
    }
    if (rc != SQLITE_DONE) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Email update failed", errorText);
        return Result<bool>("Database error during email update", detail::storageErrorCode(rc));
    }
    if (sqlite3_changes(db) == 0) {
        return Result<bool>("User not found", ErrorCode::NOT_FOUND);
    }

    REPO_LOG_INFO(COMPONENT_NAME, "Email updated", "UserID: " + userId);
    return Result<bool>(true);
}

Result<std::map<std::string, std::string>> UserRepository::updateProfile(
    const std::string& userId, const std::map<std::string, std::string>& fields) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "updateProfile");
    using ProfileResult = Result<std::map<std::string, std::string>>;

    // Read and write under one lock so concurrent merges cannot lose fields
    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "SELECT profile_fields FROM users WHERE user_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ProfileResult("Failed to prepare profile query", detail::storageErrorCode(rc));
    }
    sqlite3_bind_text(stmt, 1, userId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return ProfileResult("User not found", ErrorCode::NOT_FOUND);
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return ProfileResult("Database error while reading profile", detail::storageErrorCode(rc));
    }

    auto profile = parseProfile(detail::columnText(stmt, 0));
    sqlite3_finalize(stmt);

    for (const auto& [key, value] : fields) {
        if (value.empty()) {
            profile.erase(key);
        } else {
            profile[key] = value;
        }
    }

    std::string serialized;
    try {
        serialized = serializeProfile(profile);
    } catch (const json::exception& e) {
        REPO_LOG_WARNING(COMPONENT_NAME, "Profile update rejected", e.what());
        return ProfileResult("Profile fields must be valid UTF-8", ErrorCode::BAD_REQUEST);
    }
    rc = sqlite3_prepare_v2(db, "UPDATE users SET profile_fields = ? WHERE user_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ProfileResult("Failed to prepare profile update", detail::storageErrorCode(rc));
    }
    sqlite3_bind_text(stmt, 1, serialized.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, userId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Profile update failed", detail::storageError(db, "step"));
        return ProfileResult("Database error during profile update", detail::storageErrorCode(rc));
    }

    REPO_LOG_INFO(COMPONENT_NAME, "Profile updated",
                  "UserID: " + userId + ", fields: " + std::to_string(fields.size()));
    return ProfileResult(profile);
}

Result<bool> UserRepository::updateLastLogin(const std::string& userId) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "updateLastLogin");

    const std::string sql = "UPDATE users SET last_login = " + std::to_string(toUnixSeconds(m_clock())) +
                            " WHERE user_id = ?";
    return updateSingleUser(sql, userId, "last login update");
}

Result<bool> UserRepository::disableUser(const std::string& userId) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "disableUser");

    auto result = updateSingleUser("UPDATE users SET disabled = 1 WHERE user_id = ?", userId, "disable");
    if (result) {
        REPO_LOG_INFO(COMPONENT_NAME, "User disabled", "UserID: " + userId);
    }
    return result;
}

Result<bool> UserRepository::updateSingleUser(const std::string& sql, const std::string& userId,
                                              const std::string& operation) {
    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<bool>("Failed to prepare " + operation + " statement", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, userId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        REPO_LOG_ERROR(COMPONENT_NAME, "User " + operation + " failed", detail::storageError(db, "step"));
        return Result<bool>("Database error during " + operation, detail::storageErrorCode(rc));
    }

    if (sqlite3_changes(db) == 0) {
        return Result<bool>("User not found", ErrorCode::NOT_FOUND);
    }
    return Result<bool>(true);
}

Result<PaginatedResult<User>> UserRepository::listUsers(const PaginationParams& params) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "listUsers");

    std::string sortColumn;
    if (params.sortField == "created_at" || params.sortField == "username" || params.sortField == "email") {
        sortColumn = params.sortField;
    } else {
        return Result<PaginatedResult<User>>("Unsupported sort field: " + params.sortField, ErrorCode::BAD_REQUEST);
    }

    int limit = params.limit <= 0 ? 50 : std::min(params.limit, MAX_PAGE_SIZE);
    int offset = std::max(params.offset, 0);

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM users", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<PaginatedResult<User>>("Failed to prepare user count", detail::storageErrorCode(rc));
    }
    rc = sqlite3_step(stmt);
    int total = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return Result<PaginatedResult<User>>("Database error while counting users", detail::storageErrorCode(rc));
    }

    const std::string sql = std::string("SELECT ") + USER_COLUMNS + " FROM users ORDER BY " + sortColumn +
                            (params.ascending ? " ASC" : " DESC") + ", user_id LIMIT ? OFFSET ?";
    rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<PaginatedResult<User>>("Failed to prepare user listing", detail::storageErrorCode(rc));
    }
    sqlite3_bind_int(stmt, 1, limit);
    sqlite3_bind_int(stmt, 2, offset);

    std::vector<User> users;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        users.push_back(mapRowToUser(stmt).withoutSecrets());
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result<PaginatedResult<User>>("Database error while listing users", detail::storageErrorCode(rc));
    }

    return Result<PaginatedResult<User>>(PaginatedResult<User>(users, total, offset, limit));
}

User UserRepository::mapRowToUser(sqlite3_stmt* stmt) {
    User user;
    user.userId = detail::columnText(stmt, 0);
    user.username = detail::columnText(stmt, 1);
    user.email = detail::columnText(stmt, 2);
    user.passwordHash = detail::columnText(stmt, 3);

    // Extract salt blob
    const void* saltData = sqlite3_column_blob(stmt, 4);
    int saltSize = sqlite3_column_bytes(stmt, 4);
    if (saltData && saltSize > 0) {
        user.salt.assign(static_cast<const uint8_t*>(saltData),
                         static_cast<const uint8_t*>(saltData) + saltSize);
    }

    user.iterations = sqlite3_column_int(stmt, 5);
    user.createdAt = fromUnixSeconds(sqlite3_column_int64(stmt, 6));
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        user.lastLogin = fromUnixSeconds(sqlite3_column_int64(stmt, 7));
    }
    user.profileFields = parseProfile(detail::columnText(stmt, 8));
    user.disabled = sqlite3_column_int(stmt, 9) != 0;

    return user;
}

std::map<std::string, std::string> UserRepository::parseProfile(const std::string& text) {
    std::map<std::string, std::string> fields;
    if (text.empty()) {
        return fields;
    }

    try {
        json j = json::parse(text);
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_string()) {
                fields[it.key()] = it.value().get<std::string>();
            } else {
                fields[it.key()] = it.value().dump();
            }
        }
    } catch (const json::exception& e) {
        REPO_LOG_WARNING(COMPONENT_NAME, "Ignoring unreadable profile_fields", e.what());
    }
    return fields;
}

std::string UserRepository::serializeProfile(const std::map<std::string, std::string>& fields) {
    json j = json::object();
    for (const auto& [key, value] : fields) {
        j[key] = value;
    }
    return j.dump();
}

} // namespace Repository
