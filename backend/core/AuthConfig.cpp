#include "AuthConfig.h"
#include "Repository/Logger.h"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Auth {

namespace {

constexpr const char *COMPONENT_NAME = "AuthConfig";

std::string GetEnvVar(const char *varName) {
  const char *envValue = std::getenv(varName);
  return envValue ? std::string(envValue) : std::string();
}

std::chrono::seconds ReadSeconds(const json &j, const char *key,
                                 std::chrono::seconds fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  return std::chrono::seconds(j.at(key).get<int64_t>());
}

} // namespace

Repository::Result<bool> AuthConfig::validate() const {
  using Repository::ErrorCode::BAD_REQUEST;

  if (databasePath.empty()) {
    return Repository::Result<bool>("database_path must not be empty",
                                    BAD_REQUEST);
  }
  if (!encryptionKey.empty() && encryptionKey.size() < 32) {
    return Repository::Result<bool>(
        "encryption_key must be at least 32 characters", BAD_REQUEST);
  }
  if (passwordIterations < MIN_PASSWORD_ITERATIONS ||
      passwordIterations > MAX_PASSWORD_ITERATIONS) {
    return Repository::Result<bool>(
        "password_iterations must be between 1000 and 10000000", BAD_REQUEST);
  }
  if (sessionTtl.count() <= 0 || maxSessionLifetime < sessionTtl) {
    return Repository::Result<bool>(
        "session_ttl must be positive and no longer than "
        "max_session_lifetime",
        BAD_REQUEST);
  }
  if (lockoutThreshold <= 0 || lockoutWindow.count() <= 0) {
    return Repository::Result<bool>(
        "lockout_threshold and lockout_window must be positive", BAD_REQUEST);
  }
  if (resetTokenTtl.count() <= 0 || sweepInterval.count() <= 0) {
    return Repository::Result<bool>(
        "reset_token_ttl and sweep_interval must be positive", BAD_REQUEST);
  }
  return Repository::Result<bool>(true);
}

Repository::Result<AuthConfig> ApplyConfigFile(AuthConfig config,
                                               const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return Repository::Result<AuthConfig>("Cannot open config file: " + path,
                                          Repository::ErrorCode::NOT_FOUND);
  }

  try {
    json j = json::parse(in);
    if (!j.is_object()) {
      return Repository::Result<AuthConfig>(
          "Config file must contain a JSON object",
          Repository::ErrorCode::BAD_REQUEST);
    }

    static const char *const knownKeys[] = {
        "database_path",      "encryption_key",
        "log_file",           "password_iterations",
        "session_ttl",        "sliding_expiration",
        "max_session_lifetime", "lockout_threshold",
        "lockout_window",     "reset_token_ttl",
        "sweep_interval"};
    for (auto it = j.begin(); it != j.end(); ++it) {
      bool known = false;
      for (const char *key : knownKeys) {
        known = known || it.key() == key;
      }
      if (!known) {
        REPO_LOG_WARNING(COMPONENT_NAME, "Ignoring unknown config key",
                         it.key());
      }
    }

    config.databasePath = j.value("database_path", config.databasePath);
    config.encryptionKey = j.value("encryption_key", config.encryptionKey);
    config.logFilePath = j.value("log_file", config.logFilePath);
    config.passwordIterations =
        j.value("password_iterations", config.passwordIterations);
    config.sessionTtl = ReadSeconds(j, "session_ttl", config.sessionTtl);
    config.slidingExpiration =
        j.value("sliding_expiration", config.slidingExpiration);
    config.maxSessionLifetime =
        ReadSeconds(j, "max_session_lifetime", config.maxSessionLifetime);
    config.lockoutThreshold =
        j.value("lockout_threshold", config.lockoutThreshold);
    config.lockoutWindow =
        ReadSeconds(j, "lockout_window", config.lockoutWindow);
    config.resetTokenTtl =
        ReadSeconds(j, "reset_token_ttl", config.resetTokenTtl);
    config.sweepInterval =
        ReadSeconds(j, "sweep_interval", config.sweepInterval);
  } catch (const json::exception &e) {
    return Repository::Result<AuthConfig>(
        "Invalid config file " + path + ": " + e.what(),
        Repository::ErrorCode::BAD_REQUEST);
  }

  return Repository::Result<AuthConfig>(config);
}

AuthConfig ApplyEnvironment(AuthConfig config) {
  std::string dbPath = GetEnvVar("MONUMENT_AUTH_DB_PATH");
  std::string dbKey = GetEnvVar("MONUMENT_AUTH_DB_KEY");
  std::string logPath = GetEnvVar("MONUMENT_AUTH_LOG_PATH");

  if (!dbPath.empty())
    config.databasePath = dbPath;
  if (!dbKey.empty())
    config.encryptionKey = dbKey;
  if (!logPath.empty())
    config.logFilePath = logPath;

  return config;
}

Repository::Result<AuthConfig> LoadAuthConfig(const std::string &path) {
  AuthConfig config;

  if (!path.empty()) {
    auto fileResult = ApplyConfigFile(config, path);
    if (!fileResult) {
      return fileResult;
    }
    config = *fileResult;
  }

  config = ApplyEnvironment(config);

  auto valid = config.validate();
  if (!valid) {
    return Repository::Result<AuthConfig>(valid.error(), valid.errorCode);
  }
  return Repository::Result<AuthConfig>(config);
}

} // namespace Auth
