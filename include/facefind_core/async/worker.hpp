#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace facefind_core {
class ServiceProvider;
}

namespace facefind_core {
namespace async {

/**
 * @class Worker
 * @brief A single background thread that executes tasks from the work queue.
 *
 * Managed by a WorkerPool. Non-copyable and non-movable so the owning pool
 * has clear ownership of the underlying thread.
 */
 class Worker {
  public:
      /**
       * @brief Constructs a Worker instance.
       * @param worker_id Identifier used for logging.
       * @param services Shared services; the work queue is taken from here.
       */
      Worker(int worker_id, std::shared_ptr<ServiceProvider> services);

      /**
       * @brief Stops the worker and joins its thread.
       */
      ~Worker();

      /**
       * @brief Starts the processing loop on a new thread.
       *
       * Throws if the worker is already running.
       */
      void start();

      /**
       * @brief Signals the loop to exit after the current task. Does not block.
       */
      void stop();

      void join();

      Worker(const Worker&) = delete;
      Worker& operator=(const Worker&) = delete;
      Worker(Worker&&) = delete;
      Worker& operator=(Worker&&) = delete;

      // Executes at most one queued task on the calling thread.
      bool run_one_task(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

  private:
      void run_loop();
      int worker_id_;
      std::shared_ptr<ServiceProvider> services_;
      std::atomic<bool> should_stop{false};
      std::thread thread;
  };
}
}
