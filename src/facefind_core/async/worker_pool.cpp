#include "facefind_core/async/worker_pool.hpp"
#include "facefind_core/async/deadline.hpp"
#include "facefind_core/async/service_provider.hpp"
#include <iostream>
#include <stdexcept>

namespace facefind_core::async {

WorkerPool::WorkerPool(size_t num_threads, std::shared_ptr<ServiceProvider> services)
    : m_services(services) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool must have at least one thread.");
    }

    m_workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), services));
    }
    std::cout << "WorkerPool created with " << num_threads << " workers";
    if (auto slots = m_services ? m_services->get_call_slots() : nullptr) {
        std::cout << ", at most " << slots->limit() << " blocking calls in flight";
    }
    std::cout << "." << std::endl;
}

WorkerPool::~WorkerPool() {
    if (m_is_running) {
        stop();
    }
}

void WorkerPool::start() {
    if (m_is_running) {
        std::cerr << "Warning: WorkerPool is already running." << std::endl;
        return;
    }
    std::cout << "Starting all workers in the pool..." << std::endl;
    for (const auto& worker : m_workers) {
        worker->start();
    }
    m_is_running = true;
}

void WorkerPool::stop(std::chrono::milliseconds abandoned_call_grace) {
    if (!m_is_running) {
        return;
    }
    std::cout << "Stopping all workers in the pool..." << std::endl;
    // Signal everyone first so the workers wind down in parallel
    for (const auto& worker : m_workers) {
        worker->stop();
    }
    for (const auto& worker : m_workers) {
        worker->join();
    }
    m_is_running = false;

    std::shared_ptr<CallSlots> slots = m_services ? m_services->get_call_slots() : nullptr;
    if (slots && !slots->wait_idle_for(abandoned_call_grace)) {
        std::cerr << "Warning: " << slots->in_flight()
                  << " timed-out calls are still running after the workers stopped." << std::endl;
    }
}

} // namespace facefind_core::async
