/**
 * @file test_auth_config.cpp
 * @brief Unit tests for AuthConfig loading and validation
 */

#include "AuthConfig.h"
#include "TestUtils.h"

#include <cstdlib>
#include <fstream>

namespace {

const std::string CONFIG_PATH = "test_auth_config.json";

void writeConfigFile(const std::string& contents) {
    std::ofstream out(CONFIG_PATH, std::ios::trunc);
    out << contents;
}

} // namespace

// ============================================================================
// Test Cases
// ============================================================================

static bool testDefaults() {
    TEST_START("Defaults - Documented Values");

    Auth::AuthConfig config;
    TEST_ASSERT(config.sessionTtl == std::chrono::hours(24 * 30), "Session TTL defaults to 30 days");
    TEST_ASSERT(config.maxSessionLifetime == std::chrono::hours(24 * 90), "Lifetime cap defaults to 90 days");
    TEST_ASSERT(config.slidingExpiration, "Sliding expiration is on by default");
    TEST_ASSERT(config.lockoutThreshold == 5, "Lockout threshold defaults to 5");
    TEST_ASSERT(config.lockoutWindow == std::chrono::minutes(15), "Lockout window defaults to 15 minutes");
    TEST_ASSERT(config.resetTokenTtl == std::chrono::hours(1), "Reset tokens last one hour");
    TEST_ASSERT(config.validate().hasValue(), "Defaults should validate");

    TEST_PASS();
}

static bool testFileOverlay() {
    TEST_START("Config File - Overlay and Unknown Keys");

    writeConfigFile(R"({
        "database_path": "overlay.db",
        "password_iterations": 200000,
        "session_ttl": 3600,
        "sliding_expiration": false,
        "lockout_threshold": 3,
        "favourite_colour": "green"
    })");

    auto loaded = Auth::ApplyConfigFile(Auth::AuthConfig(), CONFIG_PATH);
    TEST_ASSERT(loaded.hasValue(), "File should load: " << loaded.error());
    TEST_ASSERT(loaded->databasePath == "overlay.db", "Path should be overridden");
    TEST_ASSERT(loaded->passwordIterations == 200000, "Iterations should be overridden");
    TEST_ASSERT(loaded->sessionTtl == std::chrono::seconds(3600), "Durations are read in seconds");
    TEST_ASSERT(!loaded->slidingExpiration, "Boolean should be overridden");
    TEST_ASSERT(loaded->lockoutThreshold == 3, "Threshold should be overridden");
    TEST_ASSERT(loaded->lockoutWindow == std::chrono::minutes(15), "Absent keys keep their defaults");

    TEST_PASS();
}

static bool testFileErrors() {
    TEST_START("Config File - Missing and Malformed");

    TestUtils::cleanupTestDatabase(CONFIG_PATH);
    auto missing = Auth::ApplyConfigFile(Auth::AuthConfig(), CONFIG_PATH);
    TEST_ASSERT(!missing.hasValue(), "Missing file should fail");
    TEST_ASSERT(missing.errorCode == 404, "Missing file is 404");

    writeConfigFile("{ not json");
    auto malformed = Auth::ApplyConfigFile(Auth::AuthConfig(), CONFIG_PATH);
    TEST_ASSERT(!malformed.hasValue(), "Malformed file should fail");
    TEST_ASSERT(malformed.errorCode == 400, "Malformed file is 400");

    writeConfigFile("[1, 2, 3]");
    TEST_ASSERT(Auth::ApplyConfigFile(Auth::AuthConfig(), CONFIG_PATH).errorCode == 400,
                "Non-object JSON is 400");

    writeConfigFile(R"({"session_ttl": "a day"})");
    TEST_ASSERT(Auth::ApplyConfigFile(Auth::AuthConfig(), CONFIG_PATH).errorCode == 400,
                "Wrongly typed value is 400");

    TEST_PASS();
}

static bool testValidation() {
    TEST_START("Validate - Rejects Unsafe Settings");

    Auth::AuthConfig lowIterations;
    lowIterations.passwordIterations = 999;
    TEST_ASSERT(!lowIterations.validate().hasValue(), "Fewer than 1000 iterations is rejected");

    Auth::AuthConfig highIterations;
    highIterations.passwordIterations = Auth::MAX_PASSWORD_ITERATIONS + 1;
    auto tooHigh = highIterations.validate();
    TEST_ASSERT(!tooHigh.hasValue(), "Iterations above the ceiling are rejected");
    TEST_ASSERT(tooHigh.errorCode == 400, "Iteration ceiling failure is 400");
    highIterations.passwordIterations = 3000000000u;
    TEST_ASSERT(!highIterations.validate().hasValue(), "Counts past the signed int range are rejected");
    highIterations.passwordIterations = Auth::MAX_PASSWORD_ITERATIONS;
    TEST_ASSERT(highIterations.validate().hasValue(), "The ceiling itself is accepted");

    Auth::AuthConfig shortKey;
    shortKey.encryptionKey = "too-short";
    TEST_ASSERT(!shortKey.validate().hasValue(), "Short encryption keys are rejected");

    Auth::AuthConfig ttlOverCap;
    ttlOverCap.sessionTtl = std::chrono::hours(24 * 100);
    TEST_ASSERT(!ttlOverCap.validate().hasValue(), "TTL longer than the lifetime cap is rejected");

    Auth::AuthConfig noLockout;
    noLockout.lockoutThreshold = 0;
    TEST_ASSERT(!noLockout.validate().hasValue(), "Lockout cannot be switched off");

    writeConfigFile(R"({"password_iterations": 10})");
    auto loaded = Auth::LoadAuthConfig(CONFIG_PATH);
    TEST_ASSERT(!loaded.hasValue(), "LoadAuthConfig should validate");
    TEST_ASSERT(loaded.errorCode == 400, "Validation failure is 400");

    TEST_PASS();
}

static bool testEnvironmentOverride() {
    TEST_START("Environment - Overrides File Values");

    writeConfigFile(R"({"database_path": "from_file.db", "log_file": "from_file.log"})");
    setenv("MONUMENT_AUTH_DB_PATH", "from_env.db", 1);

    auto loaded = Auth::LoadAuthConfig(CONFIG_PATH);
    unsetenv("MONUMENT_AUTH_DB_PATH");

    TEST_ASSERT(loaded.hasValue(), "Config should load: " << loaded.error());
    TEST_ASSERT(loaded->databasePath == "from_env.db", "Environment wins over the file");
    TEST_ASSERT(loaded->logFilePath == "from_file.log", "Unset variables leave file values alone");

    auto defaults = Auth::LoadAuthConfig();
    TEST_ASSERT(defaults.hasValue(), "No file means defaults");
    TEST_ASSERT(defaults->databasePath == Auth::AuthConfig().databasePath, "Default path applies");

    TEST_PASS();
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    TestUtils::printTestHeader("AuthConfig Unit Tests");
    TestUtils::initializeTestLogger("test_auth_config.log");

    testDefaults();
    testFileOverlay();
    testFileErrors();
    testValidation();
    testEnvironmentOverride();

    TestUtils::cleanupTestDatabase(CONFIG_PATH);
    Repository::Logger::getInstance().shutdown();
    TestUtils::printTestSummary("AuthConfig Test");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
