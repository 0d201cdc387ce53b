#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace facefind_core {

class ItemTimeoutError : public std::exception {
 public:
  explicit ItemTimeoutError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

namespace async {

/**
 * @class CallSlots
 * @brief Counting limit on blocking calls (downloads, engine calls).
 *
 * A call abandoned by run_with_deadline() keeps its slot until it actually
 * returns, so a hung collaborator cannot push the number of in-flight calls
 * past the limit.
 */
class CallSlots {
 public:
  explicit CallSlots(size_t limit) : limit_(limit) {
    if (limit_ == 0) {
      throw std::invalid_argument("CallSlots requires a limit of at least one.");
    }
  }

  CallSlots(const CallSlots&) = delete;
  CallSlots& operator=(const CallSlots&) = delete;

  void acquire() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return in_flight_ < limit_; });
    ++in_flight_;
  }

  bool try_acquire_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!cv_.wait_until(lock, deadline, [this] { return in_flight_ < limit_; })) {
      return false;
    }
    ++in_flight_;
    return true;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (in_flight_ > 0) {
        --in_flight_;
      }
    }
    cv_.notify_all();
  }

  // False when calls are still running after `timeout`.
  bool wait_idle_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
  }

  size_t in_flight() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return in_flight_;
  }

  size_t limit() const {
    return limit_;
  }

 private:
  const size_t limit_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  size_t in_flight_ = 0;
};

/**
 * @brief Runs `fn` and waits at most `timeout` for its result.
 *
 * On timeout the call keeps running on a detached thread and its result is
 * discarded, so `fn` must own everything it touches (capture shared_ptrs by
 * value). With `slots`, the call first takes a slot within the same deadline
 * and holds it until `fn` returns. A non-positive timeout runs `fn` inline
 * without a deadline.
 */
template <typename Fn>
auto run_with_deadline(Fn fn,
                       std::chrono::milliseconds timeout,
                       std::shared_ptr<CallSlots> slots = nullptr) -> decltype(fn()) {
  using Result = decltype(fn());
  if (timeout.count() <= 0) {
    if (!slots) {
      return fn();
    }
    slots->acquire();
    struct Release {
      CallSlots& slots;
      ~Release() { slots.release(); }
    } release{*slots};
    return fn();
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const std::string timed_out = "Timed out after " + std::to_string(timeout.count()) + " ms";
  if (slots && !slots->try_acquire_until(deadline)) {
    throw ItemTimeoutError(timed_out + " waiting for a free call slot");
  }

  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  std::future<Result> result = task->get_future();
  try {
    std::thread([task, slots]() {
      (*task)();
      if (slots) {
        slots->release();
      }
    }).detach();
  } catch (const std::system_error&) {
    if (slots) {
      slots->release();
    }
    throw;
  }

  if (result.wait_until(deadline) == std::future_status::timeout) {
    throw ItemTimeoutError(timed_out);
  }
  return result.get();
}

}  // namespace async
}  // namespace facefind_core
