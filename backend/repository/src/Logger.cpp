#include "../include/Repository/Logger.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Repository {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

bool Logger::initialize(const std::string& logFilePath, LogLevel minLevel, bool enableConsole) {
    {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

        if (m_initialized) {
            return true;  // Already initialized
        }

        m_logFilePath = logFilePath;
        m_minLevel = minLevel;
        m_enableConsole = enableConsole || logFilePath.empty();

        if (!m_logFilePath.empty()) {
            m_logFile.open(m_logFilePath, std::ios::app);
            if (!m_logFile.is_open()) {
                std::cerr << "Failed to open log file: " << m_logFilePath << std::endl;
                return false;
            }
        }

        // Start the logging worker thread
        m_shutdown = false;
        m_logWorker = std::thread(&Logger::logWorker, this);

        m_initialized = true;
    }

    log(LogLevel::INFO, "Logger", "Logger initialized",
        m_logFilePath.empty() ? "Console only" : "LogFile: " + m_logFilePath);

    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    if (!m_initialized) {
        return;
    }

    // Stop accepting entries, then let the worker drain the queue
    m_initialized = false;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_shutdown = true;
    }
    m_queueCondition.notify_all();

    if (m_logWorker.joinable()) {
        m_logWorker.join();
    }

    if (m_logFile.is_open()) {
        m_logFile.close();
    }
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_drainedCondition.wait(lock, [this] { return m_pending == 0 || m_shutdown; });
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& details) {
    if (!m_initialized || level < m_minLevel) {
        return;
    }

    LogEntry entry(level, component, message, details);

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_shutdown) {
            return;
        }
        m_logQueue.push(entry);
        ++m_pending;
    }
    m_queueCondition.notify_one();

    {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        m_recentEntries.push_back(entry);
        if (m_recentEntries.size() > MAX_RECENT_ENTRIES) {
            m_recentEntries.erase(m_recentEntries.begin());
        }
    }
}

void Logger::debug(const std::string& component, const std::string& message,
                   const std::string& details) {
    log(LogLevel::DEBUG, component, message, details);
}

void Logger::info(const std::string& component, const std::string& message,
                  const std::string& details) {
    log(LogLevel::INFO, component, message, details);
}

void Logger::warning(const std::string& component, const std::string& message,
                     const std::string& details) {
    log(LogLevel::WARNING, component, message, details);
}

void Logger::error(const std::string& component, const std::string& message,
                   const std::string& details) {
    log(LogLevel::ERROR, component, message, details);
}

void Logger::critical(const std::string& component, const std::string& message,
                      const std::string& details) {
    log(LogLevel::CRITICAL, component, message, details);
}

void Logger::setMinLevel(LogLevel level) {
    m_minLevel = level;
}

std::vector<LogEntry> Logger::getRecentEntries(size_t maxEntries) const {
    std::lock_guard<std::mutex> lock(m_entriesMutex);

    if (maxEntries >= m_recentEntries.size()) {
        return m_recentEntries;
    }

    return std::vector<LogEntry>(m_recentEntries.end() - maxEntries, m_recentEntries.end());
}

std::vector<LogEntry> Logger::getRecentEntries(const std::string& component, size_t maxEntries) const {
    std::lock_guard<std::mutex> lock(m_entriesMutex);

    std::vector<LogEntry> matches;
    for (auto it = m_recentEntries.rbegin(); it != m_recentEntries.rend() && matches.size() < maxEntries; ++it) {
        if (it->component == component) {
            matches.push_back(*it);
        }
    }
    return std::vector<LogEntry>(matches.rbegin(), matches.rend());
}

std::string Logger::maskToken(const std::string& token) {
    if (token.size() <= TOKEN_PREFIX_LENGTH) {
        return std::string(token.size(), '*');
    }
    return token.substr(0, TOKEN_PREFIX_LENGTH) + "...";
}

void Logger::logWorker() {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    while (true) {
        m_queueCondition.wait(lock, [this] {
            return !m_logQueue.empty() || m_shutdown;
        });

        while (!m_logQueue.empty()) {
            LogEntry entry = m_logQueue.front();
            m_logQueue.pop();
            lock.unlock();

            writeEntry(entry);

            lock.lock();
            --m_pending;
        }
        m_drainedCondition.notify_all();

        if (m_shutdown) {
            break;
        }
    }
}

void Logger::writeEntry(const LogEntry& entry) {
    std::string logLine = formatLogEntry(entry);

    if (m_logFile.is_open()) {
        m_logFile << logLine << std::endl;
    }

    if (m_enableConsole) {
        if (entry.level >= LogLevel::ERROR) {
            std::cerr << logLine << std::endl;
        } else {
            std::cout << logLine << std::endl;
        }
    }
}

std::string Logger::formatLogEntry(const LogEntry& entry) const {
    std::ostringstream oss;

    auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) %
        1000;

    std::tm timeInfo = {};
    localtime_r(&time_t, &timeInfo);
    oss << std::put_time(&timeInfo, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    oss << " [" << logLevelToString(entry.level) << "]";
    oss << " [" << entry.component << "]";
    oss << " " << entry.message;

    if (!entry.details.empty()) {
        oss << " | " << entry.details;
    }

    return oss.str();
}

std::string Logger::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRIT";
        default:
            return "UNKNOWN";
    }
}

// ScopedLogger implementation
ScopedLogger::ScopedLogger(const std::string& component, const std::string& operation)
    : m_component(component),
      m_operation(operation),
      m_startTime(std::chrono::steady_clock::now()),
      m_completed(false) {
    Logger::getInstance().debug(m_component, "Starting operation: " + m_operation);
}

ScopedLogger::~ScopedLogger() {
    if (!m_completed) {
        std::string details = "Duration: " + std::to_string(elapsedMs()) + "ms";
        if (!m_context.empty()) {
            details += " | " + m_context;
        }

        Logger::getInstance().debug(m_component, "Completed operation: " + m_operation, details);
    }
}

long long ScopedLogger::elapsedMs() const {
    auto duration = std::chrono::steady_clock::now() - m_startTime;
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

void ScopedLogger::success(const std::string& details) {
    if (m_completed)
        return;

    std::string logDetails = "SUCCESS - Duration: " + std::to_string(elapsedMs()) + "ms";
    if (!details.empty()) {
        logDetails += " | " + details;
    }
    if (!m_context.empty()) {
        logDetails += " | " + m_context;
    }

    Logger::getInstance().info(m_component, "Operation completed: " + m_operation, logDetails);
    m_completed = true;
}

void ScopedLogger::failure(const std::string& error, const std::string& details) {
    if (m_completed)
        return;

    std::string logDetails = "FAILED - Duration: " + std::to_string(elapsedMs()) + "ms | Error: " + error;
    if (!details.empty()) {
        logDetails += " | " + details;
    }
    if (!m_context.empty()) {
        logDetails += " | " + m_context;
    }

    Logger::getInstance().error(m_component, "Operation failed: " + m_operation, logDetails);
    m_completed = true;
}

void ScopedLogger::addContext(const std::string& key, const std::string& value) {
    if (!m_context.empty()) {
        m_context += ", ";
    }
    m_context += key + "=" + value;
}

}  // namespace Repository
