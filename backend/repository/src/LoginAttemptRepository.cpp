#include "Repository/LoginAttemptRepository.h"
#include "StatementHelpers.h"

namespace Repository {

LoginAttemptRepository::LoginAttemptRepository(Database::DatabaseManager& dbManager, Clock clock)
    : m_dbManager(dbManager), m_clock(std::move(clock)) {}

void LoginAttemptRepository::record(const std::string& identifier, LoginOutcome outcome,
                                    const std::optional<std::string>& userId) noexcept {
    try {
        const std::string outcomeText = loginOutcomeToString(outcome);
        const int64_t now = toUnixSeconds(m_clock());

        auto lock = m_dbManager.acquireLock();
        sqlite3* db = m_dbManager.getHandle();

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(
            db, "INSERT INTO login_attempts (identifier, timestamp, outcome, user_id) VALUES (?, ?, ?, ?)",
            -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            REPO_LOG_ERROR(COMPONENT_NAME, "Failed to prepare attempt insert", detail::storageError(db, "prepare"));
            return;
        }

        sqlite3_bind_text(stmt, 1, identifier.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, now);
        sqlite3_bind_text(stmt, 3, outcomeText.c_str(), -1, SQLITE_STATIC);
        if (userId) {
            sqlite3_bind_text(stmt, 4, userId->c_str(), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt, 4);
        }

        rc = sqlite3_step(stmt);
        std::string errorText = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            REPO_LOG_ERROR(COMPONENT_NAME, "Login attempt not recorded",
                           "Outcome: " + outcomeText + ", error: " + errorText);
        }
    } catch (const std::exception& e) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Login attempt not recorded", e.what());
    }
}

Result<int> LoginAttemptRepository::countRecentFailures(const std::string& identifier,
                                                        std::chrono::seconds window) {
    const std::string sql = R"(
        SELECT COUNT(*)
        FROM login_attempts
        WHERE identifier = ?1
          AND timestamp >= ?2
          AND outcome IN ('bad_credentials', 'unknown_identifier', 'disabled')
          AND id > COALESCE(
              (SELECT MAX(id) FROM login_attempts WHERE identifier = ?1 AND outcome = 'success'), 0)
    )";

    const int64_t since = toUnixSeconds(m_clock() - window);

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<int>("Failed to prepare failure count", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, identifier.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, since);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        REPO_LOG_ERROR(COMPONENT_NAME, "Failure count query failed", detail::storageError(db, "step"));
        sqlite3_finalize(stmt);
        return Result<int>("Database error while counting failures", detail::storageErrorCode(rc));
    }

    int count = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    return Result<int>(count);
}

Result<std::vector<LoginAttempt>> LoginAttemptRepository::getRecentAttempts(const std::string& identifier,
                                                                            int limit) {
    const std::string sql = R"(
        SELECT id, identifier, timestamp, outcome, user_id
        FROM login_attempts
        WHERE identifier = ?
        ORDER BY id DESC
        LIMIT ?
    )";

    auto lock = m_dbManager.acquireLock();
    sqlite3* db = m_dbManager.getHandle();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<std::vector<LoginAttempt>>("Failed to prepare attempt query", detail::storageErrorCode(rc));
    }

    sqlite3_bind_text(stmt, 1, identifier.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : 20);

    std::vector<LoginAttempt> attempts;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        LoginAttempt attempt;
        attempt.id = sqlite3_column_int64(stmt, 0);
        attempt.identifier = detail::columnText(stmt, 1);
        attempt.timestamp = fromUnixSeconds(sqlite3_column_int64(stmt, 2));
        attempt.outcome = loginOutcomeFromString(detail::columnText(stmt, 3)).value_or(LoginOutcome::BAD_CREDENTIALS);
        if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
            attempt.userId = detail::columnText(stmt, 4);
        }
        attempts.push_back(attempt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result<std::vector<LoginAttempt>>("Database error while reading attempts", detail::storageErrorCode(rc));
    }
    return Result<std::vector<LoginAttempt>>(attempts);
}

}  // namespace Repository
