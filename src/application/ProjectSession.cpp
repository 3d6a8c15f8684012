/**
 * @file ProjectSession.cpp
 * @brief Implementation of ProjectSession.
 */

#include "application/ProjectSession.hpp"

namespace novelstore::application {

ProjectSession::ProjectSession(ProjectStore store)
    : m_store(std::move(store)), m_running(true) {
    m_worker = std::thread(&ProjectSession::workerLoop, this);
}

ProjectSession::~ProjectSession() {
    stop();
}

void ProjectSession::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void ProjectSession::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return; // drained
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Exceptions are captured by the packaged_task and surface through its future.
        task();
    }
}

} // namespace novelstore::application
