#include "facefind_core/async/work_queue.hpp"

#include <stdexcept>

namespace facefind_core::async {

void WorkQueue::push(ITaskPtr task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      throw std::runtime_error("Work queue is closed");
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

ITaskPtr WorkQueue::pop_for(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!cv_.wait_for(lock, wait, [this] { return !tasks_.empty(); })) {
    return nullptr;
  }
  ITaskPtr task = std::move(tasks_.front());
  tasks_.pop_front();
  return task;
}

void WorkQueue::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  closed_ = true;
  cv_.notify_all();
}

bool WorkQueue::is_closed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}

size_t WorkQueue::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return tasks_.size();
}

}  // namespace facefind_core::async
