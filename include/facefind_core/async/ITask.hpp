#pragma once

#include <memory>

namespace facefind_core {
class ServiceProvider;
}

namespace facefind_core {
class ITask {
 public:
  virtual ~ITask() = default;

  // Must not throw for per-item failures; those belong in the job's issue lists.
  virtual void execute(ServiceProvider& services) = 0;

  virtual const char* get_type() const = 0;
};

using ITaskPtr = std::unique_ptr<ITask>;
}  // namespace facefind_core
