#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Repository {

/**
 * @brief Result wrapper for repository operations
 *
 * errorCode follows HTTP conventions: 400 bad input, 403 revoked,
 * 404 not found, 409 conflict, 410 expired, 500 storage failure,
 * 503 store busy or locked.
 */
template<typename T>
struct Result {
    bool success;
    std::string errorMessage;
    T data;
    int errorCode;

    Result() : success(false), errorCode(0) {}
    Result(const T& value) : success(true), data(value), errorCode(0) {}
    Result(const std::string& error, int code = 0)
        : success(false), errorMessage(error), errorCode(code) {}

    operator bool() const { return success; }
    const T& operator*() const { return data; }
    T& operator*() { return data; }
    const T* operator->() const { return &data; }
    T* operator->() { return &data; }

    bool hasValue() const { return success; }
    const std::string& error() const { return errorMessage; }
};

// Error codes shared by the repositories
namespace ErrorCode {
    constexpr int BAD_REQUEST = 400;
    constexpr int REVOKED = 403;
    constexpr int NOT_FOUND = 404;
    constexpr int CONFLICT = 409;
    constexpr int EXPIRED = 410;
    constexpr int STORAGE = 500;
    constexpr int BUSY = 503;
}

/**
 * @brief Source of "now" for everything time-dependent
 */
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

inline int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
    return static_cast<int64_t>(std::chrono::system_clock::to_time_t(tp));
}

inline std::chrono::system_clock::time_point fromUnixSeconds(int64_t seconds) {
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(seconds));
}

/**
 * @brief Log levels for repository operations
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string details;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& det = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), details(det) {}
};

/**
 * @brief Registered account
 *
 * passwordHash and salt are only populated by the credential lookups; listings
 * and profile reads leave them empty.
 */
struct User {
    std::string userId;
    std::string username;
    std::string email;
    std::string passwordHash;
    std::vector<uint8_t> salt;
    int iterations;
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> lastLogin;
    std::map<std::string, std::string> profileFields;
    bool disabled;

    User() : iterations(0), disabled(false) {}

    /**
     * @brief Copy of this user without password material
     */
    User withoutSecrets() const {
        User copy = *this;
        copy.passwordHash.clear();
        copy.salt.clear();
        copy.iterations = 0;
        return copy;
    }
};

/**
 * @brief Bearer session issued on login
 */
struct Session {
    std::string token;
    std::string userId;
    std::chrono::system_clock::time_point issuedAt;
    std::chrono::system_clock::time_point expiresAt;
    bool revoked;

    Session() : revoked(false) {}
};

/**
 * @brief Identity handed to collaborators once a session checks out
 */
struct UserContext {
    std::string userId;
    std::string username;
    std::chrono::system_clock::time_point sessionExpiresAt;
};

enum class LoginOutcome {
    SUCCESS,
    BAD_CREDENTIALS,
    UNKNOWN_IDENTIFIER,
    LOCKED,
    DISABLED
};

std::string loginOutcomeToString(LoginOutcome outcome);
std::optional<LoginOutcome> loginOutcomeFromString(const std::string& value);

/**
 * @brief One row of the append-only login attempt log
 */
struct LoginAttempt {
    int64_t id;
    std::string identifier;
    std::chrono::system_clock::time_point timestamp;
    LoginOutcome outcome;
    std::optional<std::string> userId;

    LoginAttempt() : id(0), outcome(LoginOutcome::BAD_CREDENTIALS) {}
};

struct PasswordResetRequest {
    std::string token;
    std::string userId;
    std::chrono::system_clock::time_point expiresAt;
    bool used;

    PasswordResetRequest() : used(false) {}
};

/**
 * @brief Pagination parameters
 */
struct PaginationParams {
    int offset;
    int limit;
    std::string sortField;
    bool ascending;

    PaginationParams(int off = 0, int lim = 50, const std::string& sort = "created_at", bool asc = true)
        : offset(off), limit(lim), sortField(sort), ascending(asc) {}
};

/**
 * @brief Paginated result wrapper
 */
template<typename T>
struct PaginatedResult {
    std::vector<T> items;
    int totalCount;
    int offset;
    int limit;
    bool hasMore;

    PaginatedResult() : totalCount(0), offset(0), limit(0), hasMore(false) {}
    PaginatedResult(const std::vector<T>& data, int total, int off, int lim)
        : items(data), totalCount(total), offset(off), limit(lim), hasMore(off + lim < total) {}
};

} // namespace Repository
