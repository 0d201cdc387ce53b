#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "facefind_core/progress/processing_job.hpp"

namespace facefind_core {

class JobAlreadyRunningError : public std::exception {
 public:
  explicit JobAlreadyRunningError(const std::string& owner)
      : message_("A processing job is already running for owner " + owner) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class JobTracker
 * @brief At most one job per owner. Starting a job while the previous one is
 * still running is rejected; a finished job is replaced.
 */
class JobTracker {
 public:
  std::shared_ptr<ProcessingJob> begin(const std::string& owner,
                                       const std::string& folder,
                                       bool force_reprocess,
                                       size_t worker_count);

  std::shared_ptr<ProcessingJob> find(const std::string& owner) const;

  // Idle snapshot when the owner has no job.
  JobSnapshot snapshot(const std::string& owner) const;

  // Returns false when no job is running for the owner.
  bool cancel(const std::string& owner);

  // Drops a finished job. Throws JobAlreadyRunningError for a running one.
  bool reset(const std::string& owner);

 private:
  mutable std::mutex mtx_;
  std::map<std::string, std::shared_ptr<ProcessingJob>> jobs_;
};

}  // namespace facefind_core
