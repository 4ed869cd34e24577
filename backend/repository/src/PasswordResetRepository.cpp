#include "Repository/PasswordResetRepository.h"
#include "Crypto.h"
#include "StatementHelpers.h"
#include <stdexcept>

namespace Repository {

PasswordResetRepository::PasswordResetRepository(Database::DatabaseManager& dbManager, Clock clock)
    : m_dbManager(dbManager), m_clock(std::move(clock)) {}

Result<PasswordResetRequest> PasswordResetRepository::createRequest(const std::string& userId,
                                                                    std::chrono::seconds ttl) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "createRequest");

    PasswordResetRequest request;
    try {
        request.token = Crypto::GenerateUrlSafeToken(TOKEN_BYTES);
    } catch (const std::exception& e) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Failed to generate reset token", e.what());
        return Result<PasswordResetRequest>("Failed to generate reset token", ErrorCode::STORAGE);
    }
    request.userId = userId;
    request.expiresAt = fromUnixSeconds(toUnixSeconds(m_clock())) + ttl;
    request.used = false;

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(
        db, "INSERT INTO password_resets (token, user_id, expires_at, used) VALUES (?, ?, ?, 0)",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<PasswordResetRequest>("Failed to prepare reset insert", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, request.token.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, userId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, toUnixSeconds(request.expiresAt));

    rc = sqlite3_step(stmt);
    std::string errorText = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Reset request insert failed", errorText);
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
            return Result<PasswordResetRequest>("User not found", ErrorCode::NOT_FOUND);
        }
        return Result<PasswordResetRequest>("Failed to store reset request", detail::storageErrorCode(rc));
    }

    REPO_LOG_INFO(COMPONENT_NAME, "Reset requested",
                  "UserID: " + userId + ", token: " + Logger::maskToken(request.token));
    return Result<PasswordResetRequest>(request);
}

Result<PasswordResetRequest> PasswordResetRepository::findValid(const std::string& token) {
    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(
        db, "SELECT token, user_id, expires_at, used FROM password_resets WHERE token = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<PasswordResetRequest>("Failed to prepare reset query", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return Result<PasswordResetRequest>("Reset request not found", ErrorCode::NOT_FOUND);
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return Result<PasswordResetRequest>("Database error while reading reset request",
                                            detail::storageErrorCode(rc));
    }

    PasswordResetRequest request;
    request.token = detail::columnText(stmt, 0);
    request.userId = detail::columnText(stmt, 1);
    request.expiresAt = fromUnixSeconds(sqlite3_column_int64(stmt, 2));
    request.used = sqlite3_column_int(stmt, 3) != 0;
    sqlite3_finalize(stmt);

    if (request.used) {
        return Result<PasswordResetRequest>("Reset request already used", ErrorCode::NOT_FOUND);
    }
    if (m_clock() >= request.expiresAt) {
        return Result<PasswordResetRequest>("Reset request has expired", ErrorCode::EXPIRED);
    }
    return Result<PasswordResetRequest>(request);
}

Result<bool> PasswordResetRepository::markUsed(const std::string& token) {
    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "UPDATE password_resets SET used = 1 WHERE token = ? AND used = 0",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<bool>("Failed to prepare reset update", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result<bool>("Database error during reset update", detail::storageErrorCode(rc));
    }
    if (sqlite3_changes(db) == 0) {
        return Result<bool>("Reset request not found", ErrorCode::NOT_FOUND);
    }
    return Result<bool>(true);
}

}  // namespace Repository
