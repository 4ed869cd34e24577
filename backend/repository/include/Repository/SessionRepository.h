#pragma once

#include "Database/DatabaseManager.h"
#include "Logger.h"
#include "RepositoryTypes.h"
#include <chrono>
#include <string>
#include <vector>

struct sqlite3_stmt;

namespace Repository {

class SessionRepository {
  public:
    explicit SessionRepository(Database::DatabaseManager& dbManager, Clock clock = SystemClock());

    Result<Session> issue(const std::string& userId, std::chrono::seconds ttl);

    // 404 unknown token, 403 revoked or owner disabled, 410 expired
    Result<UserContext> validate(const std::string& token);

    // Slides expires_at to min(now + ttl, issued_at + maxLifetime); never shortens it
    Result<Session> extend(const std::string& token, std::chrono::seconds ttl,
                           std::chrono::seconds maxLifetime);

    Result<bool> revoke(const std::string& token);
    Result<int> revokeAllForUser(const std::string& userId);

    // Deletes expired rows in batches, dropping the connection lock between them
    Result<int> sweepExpired();

    Result<Session> getSession(const std::string& token);
    Result<std::vector<Session>> getActiveSessions(const std::string& userId);

  private:
    Session mapRowToSession(sqlite3_stmt* stmt);

    Database::DatabaseManager& m_dbManager;
    Clock m_clock;
    static constexpr const char* COMPONENT_NAME = "SessionRepository";
    static constexpr size_t TOKEN_BYTES = 32;
    static constexpr int SWEEP_BATCH_SIZE = 500;
};

}  // namespace Repository
