#include "facefind_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "facefind_core/async/ITask.hpp"
#include "facefind_core/async/service_provider.hpp"
#include "facefind_core/async/work_queue.hpp"

namespace facefind_core {
namespace async {

namespace {
constexpr std::chrono::milliseconds kPollInterval(100);
}

Worker::Worker(int worker_id, std::shared_ptr<ServiceProvider> services)
    : worker_id_(worker_id), services_(std::move(services)) {
  if (!services_) {
    throw std::invalid_argument("Worker requires a service provider.");
  }
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  join();
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::join() {
  if (thread.joinable()) {
    thread.join();
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop.load()) {
    run_one_task(kPollInterval);
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task(std::chrono::milliseconds wait) {
  ITaskPtr task = services_->get_work_queue().pop_for(wait);
  if (!task) {
    return false;
  }
  try {
    task->execute(*services_);
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR running " << task->get_type() << ": "
              << e.what() << std::endl;
  }
  return true;
}
}
}  // namespace facefind_core
