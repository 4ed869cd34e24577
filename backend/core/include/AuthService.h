#pragma once
#include "Auth.h"
#include "AuthConfig.h"
#include "PasswordHasher.h"
#include "Database/DatabaseManager.h"
#include "Repository/LoginAttemptRepository.h"
#include "Repository/PasswordResetRepository.h"
#include "Repository/SessionRepository.h"
#include "Repository/UserRepository.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Auth {

/**
 * @brief Entry point for everything that touches identities or sessions
 *
 * Safe to share between threads. Holds no per-user state: every call takes
 * an explicit token or user id. Repository failures never cross this
 * boundary; they are logged and reported as AuthResult::UNAVAILABLE.
 */
class AuthService {
public:
  AuthService(Database::DatabaseManager &db, const AuthConfig &config,
              Repository::Clock clock = Repository::SystemClock());

  AuthService(const AuthService &) = delete;
  AuthService &operator=(const AuthService &) = delete;

  /**
   * @brief Create an account
   * @return The new user without password material. INVALID_INPUT or
   *         WEAK_PASSWORD list the failed rules in violations.
   */
  AuthResponse<Repository::User> registerUser(const std::string &username,
                                              const std::string &email,
                                              const std::string &password);

  /**
   * @brief Verify credentials and open a session
   * @param identifier Username or email, any case
   */
  AuthResponse<Repository::Session> login(const std::string &identifier,
                                          const std::string &password);

  /**
   * @brief Resolve a bearer token to its user, sliding its expiry if enabled
   */
  AuthResponse<Repository::UserContext>
  validateSession(const std::string &token);

  AuthResponse<bool> logout(const std::string &token);

  /**
   * @brief Revoke every session of the token's owner, including this one
   * @return Number of sessions revoked
   */
  AuthResponse<int> logoutAll(const std::string &token);

  /**
   * @brief Rotate the password after re-checking the old one
   *
   * The new digest and the revocation of all the user's sessions are
   * committed together.
   */
  AuthResponse<bool> changePassword(const std::string &userId,
                                    const std::string &oldPassword,
                                    const std::string &newPassword);

  /**
   * @brief Issue a single-use reset token
   *
   * Returns the raw token to the in-process caller, which is responsible for
   * delivering it out of band.
   */
  AuthResponse<std::string> requestPasswordReset(const std::string &identifier);

  AuthResponse<bool> resetPassword(const std::string &resetToken,
                                   const std::string &newPassword);

  /**
   * @brief Owner-only email change through a valid session
   * @return The updated user. INVALID_INPUT lists email_format;
   *         EMAIL_TAKEN when another account holds the address.
   */
  AuthResponse<Repository::User> changeEmail(const std::string &token,
                                             const std::string &newEmail);

  /**
   * @brief Owner-only profile edit; empty values remove keys
   *
   * Keys and values must be valid UTF-8 (profile_encoding) and within the
   * length limits (profile_key_length, profile_value_length).
   */
  AuthResponse<Repository::User>
  updateProfile(const std::string &token,
                const std::map<std::string, std::string> &fields);

  // Soft-disable and revoke all sessions
  AuthResponse<bool> disableUser(const std::string &userId);

  AuthResponse<Repository::User> getUser(const std::string &userId);

  AuthResponse<std::vector<Repository::Session>>
  activeSessions(const std::string &token);

  AuthResponse<Repository::PaginatedResult<Repository::User>>
  listUsers(const Repository::PaginationParams &params =
                Repository::PaginationParams());

  AuthResponse<std::vector<Repository::LoginAttempt>>
  recentLoginAttempts(const std::string &identifier, int limit = 20);

  AuthResponse<int> sweepExpiredSessions();

  const AuthConfig &config() const { return m_config; }

private:
  template <typename T>
  AuthResponse<T> unavailable(const std::string &operation,
                              const std::string &detail);

  AuthResponse<Repository::UserContext> resolveSession(const std::string &token);

  // Maps a repository session error code onto the public result
  static AuthResult SessionErrorToResult(int errorCode);

  // Login attempts for one identifier (case-insensitive) run one at a time,
  // so the lockout count is read after every earlier attempt was recorded
  std::shared_ptr<std::mutex> identifierGate(const std::string &identifier);

  Database::DatabaseManager &m_db;
  AuthConfig m_config;
  Repository::Clock m_clock;
  PasswordHasher m_hasher;

  Repository::UserRepository m_users;
  Repository::SessionRepository m_sessions;
  Repository::LoginAttemptRepository m_attempts;
  Repository::PasswordResetRepository m_resets;

  // Used to hash submitted passwords for unknown identifiers
  std::vector<uint8_t> m_dummySalt;

  std::mutex m_gatesMutex;
  std::map<std::string, std::weak_ptr<std::mutex>> m_identifierGates;

  static constexpr const char *COMPONENT_NAME = "AuthService";
  static constexpr size_t MAX_PROFILE_KEY_LENGTH = 64;
  static constexpr size_t MAX_PROFILE_VALUE_LENGTH = 1024;
  static constexpr size_t GATE_PRUNE_THRESHOLD = 1024;
};

} // namespace Auth
