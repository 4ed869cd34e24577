#pragma once

#include "RepositoryTypes.h"
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <thread>

namespace Repository {

/**
 * @brief Thread-safe asynchronous logger shared by the storage and auth layers
 *
 * Entries are queued by the calling thread and written by a background worker
 * to the log file and, optionally, the console. Secrets must never be passed
 * in; use maskToken() for session and reset tokens.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize the logger with file path and minimum log level
     * @param logFilePath Path to the log file; empty logs to the console only
     * @param minLevel Minimum log level to record
     * @param enableConsole Whether to also log to console
     * @return true if initialization successful
     */
    bool initialize(const std::string& logFilePath, LogLevel minLevel = LogLevel::INFO, bool enableConsole = false);

    /**
     * @brief Shutdown the logger and flush all pending logs
     */
    void shutdown();

    /**
     * @brief Block until every queued entry has been written
     */
    void flush();

    /**
     * @brief Log a message
     * @param level Log level
     * @param component Component name (e.g., "AuthService")
     * @param message Main log message
     * @param details Optional additional details
     */
    void log(LogLevel level, const std::string& component, const std::string& message, const std::string& details = "");

    void debug(const std::string& component, const std::string& message, const std::string& details = "");
    void info(const std::string& component, const std::string& message, const std::string& details = "");
    void warning(const std::string& component, const std::string& message, const std::string& details = "");
    void error(const std::string& component, const std::string& message, const std::string& details = "");
    void critical(const std::string& component, const std::string& message, const std::string& details = "");

    void setMinLevel(LogLevel level);

    /**
     * @brief Get recent log entries
     * @param maxEntries Maximum number of entries to return
     * @return Vector of recent log entries, oldest first
     */
    std::vector<LogEntry> getRecentEntries(size_t maxEntries = 100) const;

    /**
     * @brief Recent entries whose component matches exactly
     */
    std::vector<LogEntry> getRecentEntries(const std::string& component, size_t maxEntries = 100) const;

    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Shorten a bearer token to a prefix that is safe to log
     */
    static std::string maskToken(const std::string& token);

    static std::string logLevelToString(LogLevel level);

private:
    Logger() : m_initialized(false), m_minLevel(LogLevel::INFO), m_enableConsole(false), m_shutdown(false), m_pending(0) {}
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Background thread function for async logging
     */
    void logWorker();

    std::string formatLogEntry(const LogEntry& entry) const;

    void writeEntry(const LogEntry& entry);

private:
    std::atomic<bool> m_initialized;
    std::atomic<LogLevel> m_minLevel;
    std::atomic<bool> m_enableConsole;
    std::atomic<bool> m_shutdown;

    std::mutex m_lifecycleMutex;
    std::string m_logFilePath;
    std::ofstream m_logFile;

    // Async logging
    std::queue<LogEntry> m_logQueue;
    size_t m_pending;  // Queued plus in-flight, guarded by m_queueMutex
    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    std::condition_variable m_drainedCondition;
    std::thread m_logWorker;

    // Recent entries cache
    mutable std::mutex m_entriesMutex;
    std::vector<LogEntry> m_recentEntries;
    static constexpr size_t MAX_RECENT_ENTRIES = 1000;
    static constexpr size_t TOKEN_PREFIX_LENGTH = 8;
};

/**
 * @brief RAII class for scoped logging of operations
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& component, const std::string& operation);
    ~ScopedLogger();

    /**
     * @brief Mark the operation as successful
     */
    void success(const std::string& details = "");

    /**
     * @brief Mark the operation as failed
     */
    void failure(const std::string& error, const std::string& details = "");

    /**
     * @brief Add additional context information
     */
    void addContext(const std::string& key, const std::string& value);

private:
    long long elapsedMs() const;

    std::string m_component;
    std::string m_operation;
    std::chrono::steady_clock::time_point m_startTime;
    bool m_completed;
    std::string m_context;
};

} // namespace Repository

// Convenience macros for logging
#define REPO_LOG_DEBUG(component, message, ...) \
    Repository::Logger::getInstance().debug(component, message, ##__VA_ARGS__)

#define REPO_LOG_INFO(component, message, ...) \
    Repository::Logger::getInstance().info(component, message, ##__VA_ARGS__)

#define REPO_LOG_WARNING(component, message, ...) \
    Repository::Logger::getInstance().warning(component, message, ##__VA_ARGS__)

#define REPO_LOG_ERROR(component, message, ...) \
    Repository::Logger::getInstance().error(component, message, ##__VA_ARGS__)

#define REPO_LOG_CRITICAL(component, message, ...) \
    Repository::Logger::getInstance().critical(component, message, ##__VA_ARGS__)

#define REPO_SCOPED_LOG(component, operation) \
    Repository::ScopedLogger _scopedLogger(component, operation)
