#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "facefind_core/async/ITask.hpp"
#include "facefind_core/async/work_queue.hpp"

namespace facefind_tests {

using facefind_core::ITask;
using facefind_core::async::WorkQueue;
using namespace std::chrono_literals;

namespace {

class NamedTask : public ITask {
 public:
  explicit NamedTask(const char* name) : name_(name) {}
  void execute(facefind_core::ServiceProvider& /*services*/) override {}
  const char* get_type() const override { return name_; }

 private:
  const char* name_;
};

}  // namespace

TEST(WorkQueueTest, PopsInFifoOrder) {
  WorkQueue queue;
  queue.push(std::make_unique<NamedTask>("first"));
  queue.push(std::make_unique<NamedTask>("second"));

  EXPECT_EQ(queue.size(), 2u);
  EXPECT_STREQ(queue.pop_for(0ms)->get_type(), "first");
  EXPECT_STREQ(queue.pop_for(0ms)->get_type(), "second");
  EXPECT_FALSE(queue.pop_for(0ms));
}

TEST(WorkQueueTest, PopWaitsForPush) {
  WorkQueue queue;
  std::thread pusher([&queue]() {
    std::this_thread::sleep_for(20ms);
    queue.push(std::make_unique<NamedTask>("late"));
  });

  auto task = queue.pop_for(2000ms);

  ASSERT_TRUE(task);
  EXPECT_STREQ(task->get_type(), "late");
  pusher.join();
}

TEST(WorkQueueTest, PushAfterCloseThrows) {
  WorkQueue queue;
  queue.close();

  EXPECT_TRUE(queue.is_closed());
  EXPECT_THROW(queue.push(std::make_unique<NamedTask>("x")), std::runtime_error);
}

}  // namespace facefind_tests
