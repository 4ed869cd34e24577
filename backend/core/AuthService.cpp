#include "AuthService.h"
#include "Repository/Logger.h"
#include "ValidationRules.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Auth {

using Repository::ErrorCode::CONFLICT;
using Repository::ErrorCode::EXPIRED;
using Repository::ErrorCode::NOT_FOUND;
using Repository::ErrorCode::REVOKED;
using Repository::LoginOutcome;

AuthService::AuthService(Database::DatabaseManager &db,
                         const AuthConfig &config, Repository::Clock clock)
    : m_db(db), m_config(config), m_clock(std::move(clock)),
      m_hasher(config.passwordIterations), m_users(db, m_clock),
      m_sessions(db, m_clock), m_attempts(db, m_clock),
      m_resets(db, m_clock), m_dummySalt(m_hasher.generateSalt()) {
  REPO_LOG_INFO(COMPONENT_NAME, "AuthService ready",
                "iterations=" + std::to_string(m_config.passwordIterations) +
                    ", lockout=" + std::to_string(m_config.lockoutThreshold) +
                    "/" + std::to_string(m_config.lockoutWindow.count()) +
                    "s");
}

template <typename T>
AuthResponse<T> AuthService::unavailable(const std::string &operation,
                                         const std::string &detail) {
  REPO_LOG_ERROR(COMPONENT_NAME, operation + " unavailable", detail);
  return Fail<T>(AuthResult::UNAVAILABLE);
}

AuthResult AuthService::SessionErrorToResult(int errorCode) {
  switch (errorCode) {
  case NOT_FOUND:
    return AuthResult::SESSION_NOT_FOUND;
  case EXPIRED:
    return AuthResult::SESSION_EXPIRED;
  case REVOKED:
    return AuthResult::SESSION_REVOKED;
  default:
    return AuthResult::UNAVAILABLE;
  }
}

std::shared_ptr<std::mutex>
AuthService::identifierGate(const std::string &identifier) {
  std::string key = identifier;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  std::lock_guard<std::mutex> lock(m_gatesMutex);
  if (m_identifierGates.size() >= GATE_PRUNE_THRESHOLD) {
    for (auto it = m_identifierGates.begin(); it != m_identifierGates.end();) {
      if (it->second.expired()) {
        it = m_identifierGates.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::shared_ptr<std::mutex> gate = m_identifierGates[key].lock();
  if (!gate) {
    gate = std::make_shared<std::mutex>();
    m_identifierGates[key] = gate;
  }
  return gate;
}

AuthResponse<Repository::User>
AuthService::registerUser(const std::string &username, const std::string &email,
                          const std::string &password) {
  REPO_SCOPED_LOG(COMPONENT_NAME, "registerUser");

  // Identity fields first, so a bad username is not reported as a weak password
  ValidationReport identity = Evaluate(UsernameRules(), username);
  ValidationReport emailReport = Evaluate(EmailRules(), email);
  identity.violatedRules.insert(identity.violatedRules.end(),
                                emailReport.violatedRules.begin(),
                                emailReport.violatedRules.end());
  if (!identity.ok()) {
    REPO_LOG_INFO(COMPONENT_NAME, "Registration rejected: invalid input",
                  "Rules: " + std::to_string(identity.violatedRules.size()));
    return Fail<Repository::User>(AuthResult::INVALID_INPUT,
                                  identity.violatedRules);
  }

  ValidationReport strength = Evaluate(PasswordRules(), password);
  if (!strength.ok()) {
    return Fail<Repository::User>(AuthResult::WEAK_PASSWORD,
                                  strength.violatedRules);
  }

  try {
    std::vector<uint8_t> salt = m_hasher.generateSalt();
    const uint32_t iterations = m_hasher.defaultIterations();
    std::string digest = m_hasher.hash(password, salt, iterations);

    Database::TransactionGuard transaction(m_db);
    auto created = m_users.createUser(username, email, digest, salt,
                                      static_cast<int>(iterations));
    if (!created) {
      if (created.errorCode == CONFLICT) {
        const bool emailTaken =
            created.error() == Repository::UserRepository::DUPLICATE_EMAIL;
        return Fail<Repository::User>(emailTaken ? AuthResult::EMAIL_TAKEN
                                                 : AuthResult::USERNAME_TAKEN);
      }
      return unavailable<Repository::User>("registerUser", created.error());
    }
    transaction.commit();

    REPO_LOG_INFO(COMPONENT_NAME, "User registered",
                  "UserID: " + created->userId);
    return Ok(created->withoutSecrets(), "Account created.");
  } catch (const std::exception &e) {
    return unavailable<Repository::User>("registerUser", e.what());
  }
}

AuthResponse<Repository::Session>
AuthService::login(const std::string &identifier, const std::string &password) {
  REPO_SCOPED_LOG(COMPONENT_NAME, "login");

  if (identifier.empty()) {
    return Fail<Repository::Session>(AuthResult::INVALID_CREDENTIALS);
  }

  try {
    // Held until the outcome is recorded
    std::shared_ptr<std::mutex> gate = identifierGate(identifier);
    std::lock_guard<std::mutex> serialized(*gate);

    // Received -> IdentifierResolved
    auto user = m_users.findByIdentifier(identifier);
    if (!user && user.errorCode != NOT_FOUND) {
      return unavailable<Repository::Session>("login", user.error());
    }
    std::optional<std::string> userId;
    if (user) {
      userId = user->userId;
    }

    // IdentifierResolved -> LockoutChecked
    auto failures =
        m_attempts.countRecentFailures(identifier, m_config.lockoutWindow);
    if (!failures) {
      return unavailable<Repository::Session>("login", failures.error());
    }
    if (*failures >= m_config.lockoutThreshold) {
      m_attempts.record(identifier, LoginOutcome::LOCKED, userId);
      REPO_LOG_WARNING(COMPONENT_NAME, "Login refused: identifier locked",
                       "Recent failures: " + std::to_string(*failures));
      return Fail<Repository::Session>(AuthResult::ACCOUNT_LOCKED);
    }

    // LockoutChecked -> CredentialVerified
    if (!user) {
      // Same amount of work as a real verification
      m_hasher.hash(password, m_dummySalt, m_hasher.defaultIterations());
      m_attempts.record(identifier, LoginOutcome::UNKNOWN_IDENTIFIER);
      return Fail<Repository::Session>(AuthResult::INVALID_CREDENTIALS);
    }

    const bool matches =
        m_hasher.verify(password, user->salt,
                        static_cast<uint32_t>(user->iterations),
                        user->passwordHash);
    if (user->disabled) {
      m_attempts.record(identifier, LoginOutcome::DISABLED, userId);
      return Fail<Repository::Session>(AuthResult::INVALID_CREDENTIALS);
    }
    if (!matches) {
      m_attempts.record(identifier, LoginOutcome::BAD_CREDENTIALS, userId);
      return Fail<Repository::Session>(AuthResult::INVALID_CREDENTIALS);
    }

    m_attempts.record(identifier, LoginOutcome::SUCCESS, userId);

    auto lastLogin = m_users.updateLastLogin(user->userId);
    if (!lastLogin) {
      REPO_LOG_WARNING(COMPONENT_NAME, "Could not update last login",
                       lastLogin.error());
    }

    if (m_hasher.needsRehash(static_cast<uint32_t>(user->iterations))) {
      std::vector<uint8_t> salt = m_hasher.generateSalt();
      std::string digest =
          m_hasher.hash(password, salt, m_hasher.defaultIterations());
      auto upgraded =
          m_users.updatePassword(user->userId, digest, salt,
                                 static_cast<int>(m_hasher.defaultIterations()));
      if (upgraded) {
        REPO_LOG_INFO(COMPONENT_NAME, "Password digest upgraded",
                      "UserID: " + user->userId + ", iterations " +
                          std::to_string(user->iterations) + " -> " +
                          std::to_string(m_hasher.defaultIterations()));
      } else {
        REPO_LOG_WARNING(COMPONENT_NAME, "Password digest upgrade failed",
                         upgraded.error());
      }
    }

    // CredentialVerified -> SessionIssued
    auto session = m_sessions.issue(user->userId, m_config.sessionTtl);
    if (!session) {
      return unavailable<Repository::Session>("login", session.error());
    }

    REPO_LOG_INFO(COMPONENT_NAME, "Login succeeded",
                  "UserID: " + user->userId);
    return Ok(*session, "Login successful.");
  } catch (const std::exception &e) {
    return unavailable<Repository::Session>("login", e.what());
  }
}

AuthResponse<Repository::UserContext>
AuthService::resolveSession(const std::string &token) {
  auto context = m_sessions.validate(token);
  if (!context) {
    AuthResult result = SessionErrorToResult(context.errorCode);
    if (result == AuthResult::UNAVAILABLE) {
      return unavailable<Repository::UserContext>("validateSession",
                                                  context.error());
    }
    return Fail<Repository::UserContext>(result);
  }
  return Ok(*context);
}

AuthResponse<Repository::UserContext>
AuthService::validateSession(const std::string &token) {
  try {
    // Validation and refresh must see the same row
    auto lock = m_db.acquireLock();

    auto resolved = resolveSession(token);
    if (!resolved.success() || !m_config.slidingExpiration) {
      return resolved;
    }

    auto refreshed = m_sessions.extend(token, m_config.sessionTtl,
                                       m_config.maxSessionLifetime);
    if (refreshed) {
      resolved.data.sessionExpiresAt = refreshed->expiresAt;
    } else {
      REPO_LOG_WARNING(COMPONENT_NAME, "Session refresh skipped",
                       refreshed.error());
    }
    return resolved;
  } catch (const std::exception &e) {
    return unavailable<Repository::UserContext>("validateSession", e.what());
  }
}

AuthResponse<bool> AuthService::logout(const std::string &token) {
  try {
    auto revoked = m_sessions.revoke(token);
    if (!revoked) {
      if (revoked.errorCode == NOT_FOUND) {
        return Fail<bool>(AuthResult::SESSION_NOT_FOUND);
      }
      return unavailable<bool>("logout", revoked.error());
    }
    return Ok(true, "Signed out.");
  } catch (const std::exception &e) {
    return unavailable<bool>("logout", e.what());
  }
}

AuthResponse<int> AuthService::logoutAll(const std::string &token) {
  try {
    auto context = resolveSession(token);
    if (!context.success()) {
      return Fail<int>(context.result);
    }

    auto revoked = m_sessions.revokeAllForUser(context.data.userId);
    if (!revoked) {
      return unavailable<int>("logoutAll", revoked.error());
    }
    return Ok(*revoked, "Signed out on all devices.");
  } catch (const std::exception &e) {
    return unavailable<int>("logoutAll", e.what());
  }
}

AuthResponse<bool> AuthService::changePassword(const std::string &userId,
                                               const std::string &oldPassword,
                                               const std::string &newPassword) {
  REPO_SCOPED_LOG(COMPONENT_NAME, "changePassword");

  try {
    auto user = m_users.getUserById(userId);
    if (!user) {
      if (user.errorCode == NOT_FOUND) {
        return Fail<bool>(AuthResult::USER_NOT_FOUND);
      }
      return unavailable<bool>("changePassword", user.error());
    }

    const bool matches =
        m_hasher.verify(oldPassword, user->salt,
                        static_cast<uint32_t>(user->iterations),
                        user->passwordHash);
    if (!matches || user->disabled) {
      REPO_LOG_WARNING(COMPONENT_NAME,
                       "Password change refused: bad current password",
                       "UserID: " + userId);
      return Fail<bool>(AuthResult::INVALID_CREDENTIALS);
    }

    ValidationReport strength = Evaluate(PasswordRules(), newPassword);
    if (!strength.ok()) {
      return Fail<bool>(AuthResult::WEAK_PASSWORD, strength.violatedRules);
    }

    std::vector<uint8_t> salt = m_hasher.generateSalt();
    std::string digest =
        m_hasher.hash(newPassword, salt, m_hasher.defaultIterations());

    Database::TransactionGuard transaction(m_db);
    auto updated = m_users.updatePassword(
        userId, digest, salt, static_cast<int>(m_hasher.defaultIterations()));
    if (!updated) {
      return unavailable<bool>("changePassword", updated.error());
    }
    auto revoked = m_sessions.revokeAllForUser(userId);
    if (!revoked) {
      return unavailable<bool>("changePassword", revoked.error());
    }
    transaction.commit();

    REPO_LOG_INFO(COMPONENT_NAME, "Password changed",
                  "UserID: " + userId + ", sessions revoked: " +
                      std::to_string(*revoked));
    return Ok(true, "Password changed. Please sign in again.");
  } catch (const std::exception &e) {
    return unavailable<bool>("changePassword", e.what());
  }
}

AuthResponse<std::string>
AuthService::requestPasswordReset(const std::string &identifier) {
  REPO_SCOPED_LOG(COMPONENT_NAME, "requestPasswordReset");

  try {
    auto user = m_users.findByIdentifier(identifier);
    if (!user) {
      if (user.errorCode == NOT_FOUND ||
          user.errorCode == Repository::ErrorCode::BAD_REQUEST) {
        return Fail<std::string>(AuthResult::USER_NOT_FOUND);
      }
      return unavailable<std::string>("requestPasswordReset", user.error());
    }
    if (user->disabled) {
      return Fail<std::string>(AuthResult::USER_NOT_FOUND);
    }

    auto request = m_resets.createRequest(user->userId, m_config.resetTokenTtl);
    if (!request) {
      return unavailable<std::string>("requestPasswordReset", request.error());
    }
    return Ok(request->token, "Password reset requested.");
  } catch (const std::exception &e) {
    return unavailable<std::string>("requestPasswordReset", e.what());
  }
}

AuthResponse<bool> AuthService::resetPassword(const std::string &resetToken,
                                              const std::string &newPassword) {
  REPO_SCOPED_LOG(COMPONENT_NAME, "resetPassword");

  ValidationReport strength = Evaluate(PasswordRules(), newPassword);
  if (!strength.ok()) {
    return Fail<bool>(AuthResult::WEAK_PASSWORD, strength.violatedRules);
  }

  try {
    auto request = m_resets.findValid(resetToken);
    if (!request) {
      if (request.errorCode == NOT_FOUND || request.errorCode == EXPIRED) {
        return Fail<bool>(AuthResult::INVALID_RESET_TOKEN);
      }
      return unavailable<bool>("resetPassword", request.error());
    }

    std::vector<uint8_t> salt = m_hasher.generateSalt();
    std::string digest =
        m_hasher.hash(newPassword, salt, m_hasher.defaultIterations());

    Database::TransactionGuard transaction(m_db);
    // Consuming the token inside the transaction makes a second redemption fail
    auto consumed = m_resets.markUsed(resetToken);
    if (!consumed) {
      if (consumed.errorCode == NOT_FOUND) {
        return Fail<bool>(AuthResult::INVALID_RESET_TOKEN);
      }
      return unavailable<bool>("resetPassword", consumed.error());
    }
    auto updated = m_users.updatePassword(
        request->userId, digest, salt,
        static_cast<int>(m_hasher.defaultIterations()));
    if (!updated) {
      return unavailable<bool>("resetPassword", updated.error());
    }
    auto revoked = m_sessions.revokeAllForUser(request->userId);
    if (!revoked) {
      return unavailable<bool>("resetPassword", revoked.error());
    }
    transaction.commit();

    REPO_LOG_INFO(COMPONENT_NAME, "Password reset completed",
                  "UserID: " + request->userId);
    return Ok(true, "Password updated. Please sign in.");
  } catch (const std::exception &e) {
    return unavailable<bool>("resetPassword", e.what());
  }
}

AuthResponse<Repository::User>
AuthService::changeEmail(const std::string &token,
                         const std::string &newEmail) {
  REPO_SCOPED_LOG(COMPONENT_NAME, "changeEmail");

  try {
    auto context = resolveSession(token);
    if (!context.success()) {
      return Fail<Repository::User>(context.result);
    }

    ValidationReport report = Evaluate(EmailRules(), newEmail);
    if (!report.ok()) {
      return Fail<Repository::User>(AuthResult::INVALID_INPUT,
                                    report.violatedRules);
    }

    auto updated = m_users.updateEmail(context.data.userId, newEmail);
    if (!updated) {
      if (updated.errorCode == CONFLICT) {
        return Fail<Repository::User>(AuthResult::EMAIL_TAKEN);
      }
      if (updated.errorCode == NOT_FOUND) {
        return Fail<Repository::User>(AuthResult::USER_NOT_FOUND);
      }
      return unavailable<Repository::User>("changeEmail", updated.error());
    }
    return getUser(context.data.userId);
  } catch (const std::exception &e) {
    return unavailable<Repository::User>("changeEmail", e.what());
  }
}

AuthResponse<Repository::User>
AuthService::updateProfile(const std::string &token,
                           const std::map<std::string, std::string> &fields) {
  try {
    auto context = resolveSession(token);
    if (!context.success()) {
      return Fail<Repository::User>(context.result);
    }

    std::vector<std::string> violations;
    for (const auto &[key, value] : fields) {
      if (key.empty() || key.size() > MAX_PROFILE_KEY_LENGTH) {
        violations.push_back("profile_key_length");
      }
      if (value.size() > MAX_PROFILE_VALUE_LENGTH) {
        violations.push_back("profile_value_length");
      }
      if (!IsValidUtf8(key) || !IsValidUtf8(value)) {
        violations.push_back("profile_encoding");
      }
    }
    if (!violations.empty()) {
      return Fail<Repository::User>(AuthResult::INVALID_INPUT, violations);
    }

    auto updated = m_users.updateProfile(context.data.userId, fields);
    if (!updated) {
      if (updated.errorCode == NOT_FOUND) {
        return Fail<Repository::User>(AuthResult::USER_NOT_FOUND);
      }
      if (updated.errorCode == Repository::ErrorCode::BAD_REQUEST) {
        return Fail<Repository::User>(AuthResult::INVALID_INPUT,
                                      {"profile_encoding"});
      }
      return unavailable<Repository::User>("updateProfile", updated.error());
    }
    return getUser(context.data.userId);
  } catch (const std::exception &e) {
    return unavailable<Repository::User>("updateProfile", e.what());
  }
}

AuthResponse<bool> AuthService::disableUser(const std::string &userId) {
  REPO_SCOPED_LOG(COMPONENT_NAME, "disableUser");

  try {
    Database::TransactionGuard transaction(m_db);
    auto disabled = m_users.disableUser(userId);
    if (!disabled) {
      if (disabled.errorCode == NOT_FOUND) {
        return Fail<bool>(AuthResult::USER_NOT_FOUND);
      }
      return unavailable<bool>("disableUser", disabled.error());
    }
    auto revoked = m_sessions.revokeAllForUser(userId);
    if (!revoked) {
      return unavailable<bool>("disableUser", revoked.error());
    }
    transaction.commit();
    return Ok(true, "Account disabled.");
  } catch (const std::exception &e) {
    return unavailable<bool>("disableUser", e.what());
  }
}

AuthResponse<Repository::User> AuthService::getUser(const std::string &userId) {
  try {
    auto user = m_users.getUserById(userId);
    if (!user) {
      if (user.errorCode == NOT_FOUND) {
        return Fail<Repository::User>(AuthResult::USER_NOT_FOUND);
      }
      return unavailable<Repository::User>("getUser", user.error());
    }
    return Ok(user->withoutSecrets());
  } catch (const std::exception &e) {
    return unavailable<Repository::User>("getUser", e.what());
  }
}

AuthResponse<std::vector<Repository::Session>>
AuthService::activeSessions(const std::string &token) {
  using Sessions = std::vector<Repository::Session>;

  try {
    auto context = resolveSession(token);
    if (!context.success()) {
      return Fail<Sessions>(context.result);
    }

    auto sessions = m_sessions.getActiveSessions(context.data.userId);
    if (!sessions) {
      return unavailable<Sessions>("activeSessions", sessions.error());
    }
    return Ok(*sessions);
  } catch (const std::exception &e) {
    return unavailable<Sessions>("activeSessions", e.what());
  }
}

AuthResponse<Repository::PaginatedResult<Repository::User>>
AuthService::listUsers(const Repository::PaginationParams &params) {
  using Page = Repository::PaginatedResult<Repository::User>;

  try {
    auto page = m_users.listUsers(params);
    if (!page) {
      if (page.errorCode == Repository::ErrorCode::BAD_REQUEST) {
        return Fail<Page>(AuthResult::INVALID_INPUT, {"sort_field"});
      }
      return unavailable<Page>("listUsers", page.error());
    }
    return Ok(*page);
  } catch (const std::exception &e) {
    return unavailable<Page>("listUsers", e.what());
  }
}

AuthResponse<std::vector<Repository::LoginAttempt>>
AuthService::recentLoginAttempts(const std::string &identifier, int limit) {
  using Attempts = std::vector<Repository::LoginAttempt>;

  try {
    auto attempts = m_attempts.getRecentAttempts(identifier, limit);
    if (!attempts) {
      return unavailable<Attempts>("recentLoginAttempts", attempts.error());
    }
    return Ok(*attempts);
  } catch (const std::exception &e) {
    return unavailable<Attempts>("recentLoginAttempts", e.what());
  }
}

AuthResponse<int> AuthService::sweepExpiredSessions() {
  try {
    auto swept = m_sessions.sweepExpired();
    if (!swept) {
      return unavailable<int>("sweepExpiredSessions", swept.error());
    }
    return Ok(*swept);
  } catch (const std::exception &e) {
    return unavailable<int>("sweepExpiredSessions", e.what());
  }
}

} // namespace Auth
