/**
 * @file ProjectSession.hpp
 * @brief Single-writer wrapper that serializes every operation on one ProjectStore.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>

#include "application/ProjectStore.hpp"

namespace novelstore::application {

/**
 * @class ProjectSession
 * @brief Owns a ProjectStore and runs submitted operations one at a time on a background thread.
 *
 * Any number of threads may submit; operations never interleave, and blocking
 * disk I/O stays off the caller's thread. Results and exceptions are
 * delivered through the returned future.
 */
class ProjectSession {
public:
    explicit ProjectSession(ProjectStore store);
    ~ProjectSession();

    ProjectSession(const ProjectSession&) = delete;
    ProjectSession& operator=(const ProjectSession&) = delete;

    /**
     * @brief Queues `operation(store)` for execution.
     * @throws std::runtime_error if the session has been stopped.
     */
    template <typename F>
    auto submit(F&& operation) -> std::future<std::invoke_result_t<F, ProjectStore&>> {
        using Result = std::invoke_result_t<F, ProjectStore&>;

        auto task = std::make_shared<std::packaged_task<Result()>>(
            [this, op = std::forward<F>(operation)]() mutable -> Result {
                try {
                    return op(m_store);
                } catch (const std::exception& e) {
                    std::cerr << "[ProjectSession] Operation failed: " << e.what() << std::endl;
                    throw;
                }
            });
        auto future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                throw std::runtime_error("ProjectSession is stopped");
            }
            m_queue.push([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return future;
    }

    /**
     * @brief Stops accepting work, finishes everything already queued and joins the worker.
     */
    void stop();

    bool isRunning() const { return m_running; }

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    ProjectStore m_store;

    // Thread Safety
    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace novelstore::application
