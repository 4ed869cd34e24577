#include "Repository/SessionRepository.h"
#include "Crypto.h"
#include "StatementHelpers.h"
#include <algorithm>
#include <stdexcept>

namespace Repository {

SessionRepository::SessionRepository(Database::DatabaseManager& dbManager, Clock clock)
    : m_dbManager(dbManager), m_clock(std::move(clock)) {}

Result<Session> SessionRepository::issue(const std::string& userId, std::chrono::seconds ttl) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "issue");

    if (userId.empty() || ttl.count() <= 0) {
        return Result<Session>("A user id and a positive lifetime are required", ErrorCode::BAD_REQUEST);
    }

    Session session;
    try {
        session.token = Crypto::GenerateUrlSafeToken(TOKEN_BYTES);
    } catch (const std::exception& e) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Failed to generate session token", e.what());
        return Result<Session>("Failed to generate session token", ErrorCode::STORAGE);
    }
    session.userId = userId;
    session.issuedAt = fromUnixSeconds(toUnixSeconds(m_clock()));
    session.expiresAt = session.issuedAt + ttl;
    session.revoked = false;

    const std::string sql = R"(
        INSERT INTO sessions (token, user_id, issued_at, expires_at, revoked)
        VALUES (?, ?, ?, ?, 0)
    )";

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Session>("Failed to prepare session insert", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, session.token.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, userId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, toUnixSeconds(session.issuedAt));
    sqlite3_bind_int64(stmt, 4, toUnixSeconds(session.expiresAt));

    rc = sqlite3_step(stmt);
    std::string errorText = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Session insert failed", errorText);
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
            return Result<Session>("Session owner does not exist", ErrorCode::NOT_FOUND);
        }
        return Result<Session>("Failed to store session", detail::storageErrorCode(rc));
    }

    REPO_LOG_INFO(COMPONENT_NAME, "Session issued",
                  "UserID: " + userId + ", token: " + Logger::maskToken(session.token));
    return Result<Session>(session);
}

Result<UserContext> SessionRepository::validate(const std::string& token) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "validate");

    if (token.empty()) {
        return Result<UserContext>("Session not found", ErrorCode::NOT_FOUND);
    }

    const std::string sql = R"(
        SELECT s.user_id, u.username, s.expires_at, s.revoked, u.disabled
        FROM sessions s
        JOIN users u ON u.user_id = s.user_id
        WHERE s.token = ?
    )";

    const int64_t now = toUnixSeconds(m_clock());

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<UserContext>("Failed to prepare session query", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return Result<UserContext>("Session not found", ErrorCode::NOT_FOUND);
    }
    if (rc != SQLITE_ROW) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Session query failed", detail::storageError(db, "step"));
        sqlite3_finalize(stmt);
        return Result<UserContext>("Database error while reading session", detail::storageErrorCode(rc));
    }

    UserContext context;
    context.userId = detail::columnText(stmt, 0);
    context.username = detail::columnText(stmt, 1);
    const int64_t expiresAt = sqlite3_column_int64(stmt, 2);
    const bool revoked = sqlite3_column_int(stmt, 3) != 0;
    const bool ownerDisabled = sqlite3_column_int(stmt, 4) != 0;
    sqlite3_finalize(stmt);

    context.sessionExpiresAt = fromUnixSeconds(expiresAt);

    if (revoked || ownerDisabled) {
        return Result<UserContext>("Session has been revoked", ErrorCode::REVOKED);
    }
    if (now >= expiresAt) {
        return Result<UserContext>("Session has expired", ErrorCode::EXPIRED);
    }

    return Result<UserContext>(context);
}

Result<Session> SessionRepository::extend(const std::string& token, std::chrono::seconds ttl,
                                          std::chrono::seconds maxLifetime) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "extend");

    // Hold the lock across read and update so two refreshes cannot interleave
    auto lock = m_dbManager.acquireLock();

    auto current = getSession(token);
    if (!current) {
        return current;
    }
    if (current->revoked) {
        return Result<Session>("Session has been revoked", ErrorCode::REVOKED);
    }

    const auto now = fromUnixSeconds(toUnixSeconds(m_clock()));
    if (now >= current->expiresAt) {
        return Result<Session>("Session has expired", ErrorCode::EXPIRED);
    }

    const auto cap = current->issuedAt + maxLifetime;
    const auto candidate = std::min(now + ttl, cap);
    if (candidate <= current->expiresAt) {
        return current;
    }

    sqlite3* db = m_dbManager.getHandle();
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "UPDATE sessions SET expires_at = ? WHERE token = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Session>("Failed to prepare session refresh", detail::storageErrorCode(rc));
    }

    sqlite3_bind_int64(stmt, 1, toUnixSeconds(candidate));
    sqlite3_bind_text(stmt, 2, token.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Session refresh failed", detail::storageError(db, "step"));
        return Result<Session>("Database error during session refresh", detail::storageErrorCode(rc));
    }

    Session refreshed = *current;
    refreshed.expiresAt = candidate;
    return Result<Session>(refreshed);
}

Result<bool> SessionRepository::revoke(const std::string& token) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "revoke");

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "UPDATE sessions SET revoked = 1 WHERE token = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<bool>("Failed to prepare session revoke", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result<bool>("Database error during session revoke", detail::storageErrorCode(rc));
    }
    if (sqlite3_changes(db) == 0) {
        return Result<bool>("Session not found", ErrorCode::NOT_FOUND);
    }

    REPO_LOG_INFO(COMPONENT_NAME, "Session revoked", "token: " + Logger::maskToken(token));
    return Result<bool>(true);
}

Result<int> SessionRepository::revokeAllForUser(const std::string& userId) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "revokeAllForUser");

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "UPDATE sessions SET revoked = 1 WHERE user_id = ? AND revoked = 0",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<int>("Failed to prepare bulk revoke", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, userId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result<int>("Database error during bulk revoke", detail::storageErrorCode(rc));
    }

    int revoked = sqlite3_changes(db);
    REPO_LOG_INFO(COMPONENT_NAME, "Sessions revoked for user",
                  "UserID: " + userId + ", count: " + std::to_string(revoked));
    return Result<int>(revoked);
}

Result<int> SessionRepository::sweepExpired() {
    REPO_SCOPED_LOG(COMPONENT_NAME, "sweepExpired");

    const std::string sql = R"(
        DELETE FROM sessions
        WHERE rowid IN (SELECT rowid FROM sessions WHERE expires_at <= ? LIMIT ?)
    )";

    const int64_t now = toUnixSeconds(m_clock());
    int total = 0;

    while (true) {
        // Released at the end of each batch so logins are not starved
        auto lock = m_dbManager.acquireLock();
        sqlite3* db = m_dbManager.getHandle();

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return Result<int>("Failed to prepare session sweep", detail::storageErrorCode(rc));
        }

        sqlite3_bind_int64(stmt, 1, now);
        sqlite3_bind_int(stmt, 2, SWEEP_BATCH_SIZE);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            REPO_LOG_ERROR(COMPONENT_NAME, "Session sweep failed",
                           "Deleted before failure: " + std::to_string(total));
            return Result<int>("Database error during session sweep", detail::storageErrorCode(rc));
        }

        int deleted = sqlite3_changes(db);
        total += deleted;
        if (deleted < SWEEP_BATCH_SIZE) {
            break;
        }
    }

    if (total > 0) {
        REPO_LOG_INFO(COMPONENT_NAME, "Expired sessions swept", "count: " + std::to_string(total));
    }
    return Result<int>(total);
}

Result<Session> SessionRepository::getSession(const std::string& token) {
    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(
        db, "SELECT token, user_id, issued_at, expires_at, revoked FROM sessions WHERE token = ?",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Session>("Failed to prepare session query", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        Session session = mapRowToSession(stmt);
        sqlite3_finalize(stmt);
        return Result<Session>(session);
    }
    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
        return Result<Session>("Session not found", ErrorCode::NOT_FOUND);
    }
    return Result<Session>("Database error while reading session", detail::storageErrorCode(rc));
}

Result<std::vector<Session>> SessionRepository::getActiveSessions(const std::string& userId) {
    REPO_SCOPED_LOG(COMPONENT_NAME, "getActiveSessions");

    const std::string sql = R"(
        SELECT token, user_id, issued_at, expires_at, revoked
        FROM sessions
        WHERE user_id = ? AND revoked = 0 AND expires_at > ?
        ORDER BY issued_at DESC
    )";

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<std::vector<Session>>("Failed to prepare session listing", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, userId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, toUnixSeconds(m_clock()));

    std::vector<Session> sessions;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        sessions.push_back(mapRowToSession(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result<std::vector<Session>>("Database error while listing sessions", detail::storageErrorCode(rc));
    }
    return Result<std::vector<Session>>(sessions);
}

Session SessionRepository::mapRowToSession(sqlite3_stmt* stmt) {
    Session session;
    session.token = detail::columnText(stmt, 0);
    session.userId = detail::columnText(stmt, 1);
    session.issuedAt = fromUnixSeconds(sqlite3_column_int64(stmt, 2));
    session.expiresAt = fromUnixSeconds(sqlite3_column_int64(stmt, 3));
    session.revoked = sqlite3_column_int(stmt, 4) != 0;
    return session;
}

}  // namespace Repository
