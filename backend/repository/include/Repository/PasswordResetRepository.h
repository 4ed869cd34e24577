#pragma once

#include "Database/DatabaseManager.h"
#include "Logger.h"
#include "RepositoryTypes.h"
#include <chrono>
#include <string>

namespace Repository {

/**
 * @brief Single-use, time-bounded password reset requests
 */
class PasswordResetRepository {
  public:
    explicit PasswordResetRepository(Database::DatabaseManager& dbManager, Clock clock = SystemClock());

    /**
     * @brief Create a reset request for a user
     * @param userId Owner of the request
     * @param ttl Lifetime of the token
     * @return The stored request, including the raw token for delivery
     */
    Result<PasswordResetRequest> createRequest(const std::string& userId, std::chrono::seconds ttl);

    /**
     * @brief Look up a request that is still redeemable
     * @return The request, 404 if unknown or already used, 410 if expired
     */
    Result<PasswordResetRequest> findValid(const std::string& token);

    /**
     * @brief Mark a request used; fails with 404 if it was already consumed
     */
    Result<bool> markUsed(const std::string& token);

  private:
    Database::DatabaseManager& m_dbManager;
    Clock m_clock;
    static constexpr const char* COMPONENT_NAME = "PasswordResetRepository";
    static constexpr size_t TOKEN_BYTES = 32;
};

}  // namespace Repository
