#pragma once
#include "Repository/RepositoryTypes.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace Auth {

// Runtime settings for the identity store.
//
// Layering: compiled defaults, then an optional JSON file, then the
// MONUMENT_AUTH_* environment variables. Durations in the JSON file are
// whole seconds.
constexpr uint32_t MIN_PASSWORD_ITERATIONS = 1000;
// Stored in an INTEGER column and passed to OpenSSL as int
constexpr uint32_t MAX_PASSWORD_ITERATIONS = 10000000;

struct AuthConfig {
  std::string databasePath = "monument_users.db";
  std::string encryptionKey; // SQLCipher key; empty for an unencrypted store
  std::string logFilePath = "monument_auth.log";

  uint32_t passwordIterations = 100000;

  std::chrono::seconds sessionTtl = std::chrono::hours(24 * 30);
  bool slidingExpiration = true;
  std::chrono::seconds maxSessionLifetime = std::chrono::hours(24 * 90);

  int lockoutThreshold = 5;
  std::chrono::seconds lockoutWindow = std::chrono::minutes(15);

  std::chrono::seconds resetTokenTtl = std::chrono::hours(1);
  std::chrono::seconds sweepInterval = std::chrono::hours(1);

  // Reject values that would disable a security property
  Repository::Result<bool> validate() const;
};

// Overlay a JSON file onto config. Unknown keys are logged and ignored.
Repository::Result<AuthConfig> ApplyConfigFile(AuthConfig config,
                                               const std::string &path);

// Overlay MONUMENT_AUTH_DB_PATH, MONUMENT_AUTH_DB_KEY and
// MONUMENT_AUTH_LOG_PATH when set.
AuthConfig ApplyEnvironment(AuthConfig config);

// Defaults, then path (if non-empty), then the environment, then validate().
Repository::Result<AuthConfig> LoadAuthConfig(const std::string &path = "");

} // namespace Auth
