#include "facefind_core/progress/job_tracker.hpp"

namespace facefind_core {

std::shared_ptr<ProcessingJob> JobTracker::begin(const std::string& owner,
                                                 const std::string& folder,
                                                 bool force_reprocess,
                                                 size_t worker_count) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = jobs_.find(owner);
  if (it != jobs_.end() && it->second->is_running()) {
    throw JobAlreadyRunningError(owner);
  }
  auto job = std::make_shared<ProcessingJob>(owner, folder, force_reprocess, worker_count);
  jobs_[owner] = job;
  return job;
}

std::shared_ptr<ProcessingJob> JobTracker::find(const std::string& owner) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = jobs_.find(owner);
  return it == jobs_.end() ? nullptr : it->second;
}

JobSnapshot JobTracker::snapshot(const std::string& owner) const {
  std::shared_ptr<ProcessingJob> job = find(owner);
  if (!job) {
    JobSnapshot idle;
    idle.owner = owner;
    return idle;
  }
  return job->snapshot();
}

bool JobTracker::cancel(const std::string& owner) {
  std::shared_ptr<ProcessingJob> job = find(owner);
  if (!job || !job->is_running()) {
    return false;
  }
  job->request_cancel();
  return true;
}

bool JobTracker::reset(const std::string& owner) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = jobs_.find(owner);
  if (it == jobs_.end()) {
    return false;
  }
  if (it->second->is_running()) {
    throw JobAlreadyRunningError(owner);
  }
  jobs_.erase(it);
  return true;
}

}  // namespace facefind_core
