#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace Auth {

class AuthService;

// Periodically deletes expired sessions on a background thread.
// The first sweep runs one interval after start().
class SessionSweeper {
  public:
    SessionSweeper(AuthService& service, std::chrono::milliseconds interval);
    ~SessionSweeper();

    SessionSweeper(const SessionSweeper&) = delete;
    SessionSweeper& operator=(const SessionSweeper&) = delete;

    void start();
    // Wakes the worker and joins it; safe to call more than once
    void stop();

    bool isRunning() const { return m_running; }
    int passes() const { return m_passes; }
    int totalSwept() const { return m_totalSwept; }

  private:
    void run();

    AuthService& m_service;
    std::chrono::milliseconds m_interval;

    std::atomic<bool> m_running;
    std::atomic<int> m_passes;
    std::atomic<int> m_totalSwept;

    std::mutex m_mutex;
    std::condition_variable m_wakeup;
    bool m_stopRequested;
    std::thread m_worker;

    static constexpr const char* COMPONENT_NAME = "SessionSweeper";
};

} // namespace Auth
