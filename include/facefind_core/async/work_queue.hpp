#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "facefind_core/async/ITask.hpp"

namespace facefind_core::async {

// In-memory FIFO shared between the orchestrator and the worker threads.
class WorkQueue {
 public:
  // Throws std::runtime_error once the queue is closed.
  void push(ITaskPtr task);

  // Returns nullptr when nothing arrived within `wait`.
  ITaskPtr pop_for(std::chrono::milliseconds wait);

  void close();
  bool is_closed() const;
  size_t size() const;

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<ITaskPtr> tasks_;
  bool closed_ = false;
};

}  // namespace facefind_core::async
