#pragma once

#include "Database/DatabaseManager.h"
#include "Logger.h"
#include "RepositoryTypes.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Repository {

/**
 * @brief Append-only log of login attempts, read by the lockout policy
 */
class LoginAttemptRepository {
  public:
    explicit LoginAttemptRepository(Database::DatabaseManager& dbManager, Clock clock = SystemClock());

    /**
     * @brief Append one attempt
     *
     * Best effort: a storage failure is logged and swallowed so that it never
     * changes the outcome of the login being recorded.
     */
    void record(const std::string& identifier, LoginOutcome outcome,
                const std::optional<std::string>& userId = std::nullopt) noexcept;

    /**
     * @brief Count failed attempts for an identifier inside the window
     *
     * Counts bad_credentials, unknown_identifier and disabled outcomes newer
     * than now - window that follow the most recent success for the same
     * identifier. The identifier is compared case-insensitively.
     */
    Result<int> countRecentFailures(const std::string& identifier, std::chrono::seconds window);

    /**
     * @brief Most recent attempts for an identifier, newest first
     */
    Result<std::vector<LoginAttempt>> getRecentAttempts(const std::string& identifier, int limit = 20);

  private:
    Database::DatabaseManager& m_dbManager;
    Clock m_clock;
    static constexpr const char* COMPONENT_NAME = "LoginAttemptRepository";
};

}  // namespace Repository
