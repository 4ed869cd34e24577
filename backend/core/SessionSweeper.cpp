#include "SessionSweeper.h"
#include "AuthService.h"
#include "Repository/Logger.h"

namespace Auth {

SessionSweeper::SessionSweeper(AuthService& service, std::chrono::milliseconds interval)
    : m_service(service),
      m_interval(interval),
      m_running(false),
      m_passes(0),
      m_totalSwept(0),
      m_stopRequested(false) {}

SessionSweeper::~SessionSweeper() {
    stop();
}

void SessionSweeper::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        return;
    }

    m_stopRequested = false;
    m_running = true;
    m_worker = std::thread(&SessionSweeper::run, this);
    REPO_LOG_INFO(COMPONENT_NAME, "Sweeper started",
                  "Interval: " + std::to_string(m_interval.count()) + "ms");
}

void SessionSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_stopRequested = true;
    }
    m_wakeup.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_running = false;
    REPO_LOG_INFO(COMPONENT_NAME, "Sweeper stopped",
                  "Passes: " + std::to_string(m_passes) + ", swept: " + std::to_string(m_totalSwept));
}

void SessionSweeper::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        if (m_wakeup.wait_for(lock, m_interval, [this] { return m_stopRequested; })) {
            break;
        }

        // Sweep without holding our own mutex so stop() never waits on the database
        lock.unlock();
        auto swept = m_service.sweepExpiredSessions();
        if (swept.success()) {
            m_totalSwept += swept.data;
        } else {
            REPO_LOG_WARNING(COMPONENT_NAME, "Sweep pass failed", AuthResultToString(swept.result));
        }
        ++m_passes;
        lock.lock();
    }
}

} // namespace Auth
