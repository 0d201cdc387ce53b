#pragma once

#include "facefind_core/async/worker.hpp"
#include <chrono>
#include <memory>
#include <vector>

namespace facefind_core::async {

/**
 * @class WorkerPool
 * @brief Owns the worker threads that execute queued tasks.
 *
 * The number of threads is the concurrency bound for all processing jobs.
 * Workers are stopped and joined when the pool is destroyed. Downloads and
 * engine calls abandoned after a timeout may outlive their worker; stop()
 * gives them a grace period so they do not touch the local store after
 * it is shut down.
 */
class WorkerPool {
public:
    static constexpr std::chrono::milliseconds kAbandonedCallGrace{5000};

    /**
     * @param num_threads Number of worker threads, at least one.
     * @param services Services shared by every worker.
     */
    WorkerPool(size_t num_threads, std::shared_ptr<ServiceProvider> services);

    ~WorkerPool();

    void start();

    /**
     * @brief Signals every worker to stop after its current task and waits for them,
     * then waits up to `abandoned_call_grace` for timed-out calls still holding a slot.
     */
    void stop(std::chrono::milliseconds abandoned_call_grace = kAbandonedCallGrace);

    size_t size() const {
        return m_workers.size();
    }

    bool is_running() const {
        return m_is_running;
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

private:
    std::shared_ptr<ServiceProvider> m_services;
    std::vector<std::unique_ptr<Worker>> m_workers;
    bool m_is_running = false;
};

} // namespace facefind_core::async
