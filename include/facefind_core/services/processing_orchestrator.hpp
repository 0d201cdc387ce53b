#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "facefind_core/async/service_provider.hpp"
#include "facefind_core/db/folder_snapshot_repo.hpp"
#include "facefind_core/progress/job_tracker.hpp"
#include "facefind_core/sources/photo_source.hpp"

namespace facefind_core {

struct OrchestratorOptions {
  ListingFilter filter;
  std::chrono::milliseconds item_timeout{std::chrono::seconds(120)};
  // Used for the ETA; should match the worker pool size
  size_t worker_count = 1;
};

/**
 * @class ProcessingOrchestrator
 * @brief Turns "process this folder" into per-photo tasks and tracks the job.
 *
 * start_job() returns immediately; a coordinator thread lists the folder,
 * queues one ProcessPhotoTask per accepted file, waits for the workers to
 * drain them and records the final state.
 */
class ProcessingOrchestrator {
 public:
  ProcessingOrchestrator(std::shared_ptr<ServiceProvider> services,
                         std::shared_ptr<JobTracker> tracker,
                         std::shared_ptr<FolderSnapshotRepo> snapshots,
                         OrchestratorOptions options);

  // Cancels running jobs and waits for their coordinators.
  ~ProcessingOrchestrator();

  ProcessingOrchestrator(const ProcessingOrchestrator&) = delete;
  ProcessingOrchestrator& operator=(const ProcessingOrchestrator&) = delete;

  // Throws JobAlreadyRunningError when the owner already has a running job.
  JobSnapshot start_job(const std::string& owner, const std::string& folder, bool force_reprocess);

  // Blocks until the owner's current job has finished and returns its final snapshot.
  JobSnapshot wait(const std::string& owner);

  JobSnapshot run(const std::string& owner, const std::string& folder, bool force_reprocess);

  /**
   * @brief Drops the owner's cached files and folder snapshots, for one folder or all.
   *
   * Holds the same lock as start_job(), so no job can start halfway through.
   * Throws JobAlreadyRunningError while the owner has a running job.
   * @return Number of cache entries removed.
   */
  int reset_cache(const std::string& owner, const std::optional<std::string>& folder);

  void shutdown();

 private:
  void coordinate(const std::shared_ptr<ProcessingJob>& job);

  std::shared_ptr<ServiceProvider> services_;
  std::shared_ptr<JobTracker> tracker_;
  std::shared_ptr<FolderSnapshotRepo> snapshots_;
  OrchestratorOptions options_;

  std::mutex mtx_;
  std::map<std::string, std::shared_future<void>> coordinators_;
};

}  // namespace facefind_core
