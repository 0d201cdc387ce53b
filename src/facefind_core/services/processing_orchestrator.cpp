#include "facefind_core/services/processing_orchestrator.hpp"

#include <iostream>
#include <vector>

#include "facefind_core/async/process_photo_task.hpp"
#include "facefind_core/async/work_queue.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include "facefind_core/services/content_cache.hpp"

namespace facefind_core {

ProcessingOrchestrator::ProcessingOrchestrator(std::shared_ptr<ServiceProvider> services,
                                               std::shared_ptr<JobTracker> tracker,
                                               std::shared_ptr<FolderSnapshotRepo> snapshots,
                                               OrchestratorOptions options)
    : services_(std::move(services)),
      tracker_(std::move(tracker)),
      snapshots_(std::move(snapshots)),
      options_(std::move(options)) {}

ProcessingOrchestrator::~ProcessingOrchestrator() {
  shutdown();
}

JobSnapshot ProcessingOrchestrator::start_job(const std::string& owner,
                                              const std::string& folder,
                                              bool force_reprocess) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::shared_ptr<ProcessingJob> job =
      tracker_->begin(owner, folder, force_reprocess, options_.worker_count);

  // The previous coordinator has marked its job finished; let it return
  auto previous = coordinators_.find(owner);
  if (previous != coordinators_.end()) {
    previous->second.wait();
  }

  std::cout << "Starting job for owner " << owner << " on folder '" << folder << "'"
            << (force_reprocess ? " (force reprocess)" : "") << std::endl;
  coordinators_[owner] =
      std::async(std::launch::async, [this, job] { coordinate(job); }).share();
  return job->snapshot();
}

JobSnapshot ProcessingOrchestrator::wait(const std::string& owner) {
  std::shared_future<void> coordinator;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = coordinators_.find(owner);
    if (it != coordinators_.end()) {
      coordinator = it->second;
    }
  }
  if (coordinator.valid()) {
    coordinator.wait();
  }
  return tracker_->snapshot(owner);
}

JobSnapshot ProcessingOrchestrator::run(const std::string& owner,
                                        const std::string& folder,
                                        bool force_reprocess) {
  start_job(owner, folder, force_reprocess);
  return wait(owner);
}

int ProcessingOrchestrator::reset_cache(const std::string& owner,
                                        const std::optional<std::string>& folder) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (auto job = tracker_->find(owner); job && job->is_running()) {
    throw JobAlreadyRunningError(owner);
  }
  int removed = services_->get_content_cache().reset(owner, folder);
  snapshots_->remove_all(owner, folder);
  std::cout << "Reset cache for owner " << owner
            << (folder ? " folder '" + *folder + "'" : std::string(" (all folders)")) << ": "
            << removed << " entries removed" << std::endl;
  return removed;
}

void ProcessingOrchestrator::shutdown() {
  std::vector<std::shared_future<void>> pending;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& entry : coordinators_) {
      tracker_->cancel(entry.first);
      pending.push_back(entry.second);
    }
  }
  for (auto& coordinator : pending) {
    coordinator.wait();
  }
}

void ProcessingOrchestrator::coordinate(const std::shared_ptr<ProcessingJob>& job) {
  const std::string& owner = job->owner();
  const std::string& folder = job->folder();

  std::vector<SourceFile> files;
  std::string fingerprint;
  try {
    files = filter_listing(services_->get_photo_source().list_files(folder), options_.filter);
    fingerprint = FolderSnapshotRepo::fingerprint(files);
    std::optional<FolderSnapshot> previous = snapshots_->find(owner, folder);
    job->set_totals(files.size(), previous && previous->fingerprint == fingerprint);
  } catch (const PhotoSourceError& e) {
    std::cerr << "Job for " << owner << " failed to list '" << folder << "': " << e.what()
              << std::endl;
    job->finish(JobState::Failed, std::string("Listing failed: ") + e.what());
    return;
  } catch (const LocalStoreError& e) {
    job->finish(JobState::Failed, e.what());
    return;
  } catch (const std::exception& e) {
    job->finish(JobState::Failed, std::string("Listing failed: ") + e.what());
    return;
  }

  size_t queued = 0;
  try {
    async::WorkQueue& queue = services_->get_work_queue();
    for (const auto& file : files) {
      queue.push(std::make_unique<ProcessPhotoTask>(job, file, options_.item_timeout));
      ++queued;
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "Job for " << owner << " could not queue all files: " << e.what() << std::endl;
    job->record_fatal(e.what());
    for (size_t i = queued; i < files.size(); ++i) {
      job->item_finished(ItemOutcome::Cancelled, std::chrono::steady_clock::duration::zero());
    }
  }

  job->wait_until_drained();

  JobSnapshot drained = job->snapshot();
  if (!drained.failure_reason.empty()) {
    job->finish(JobState::Failed);
  } else if (job->cancel_requested()) {
    job->finish(JobState::Cancelled);
  } else {
    try {
      FolderSnapshot snapshot;
      snapshot.owner = owner;
      snapshot.source_scope = folder;
      snapshot.fingerprint = fingerprint;
      snapshot.file_count = static_cast<int>(files.size());
      snapshot.processed_at = std::chrono::system_clock::now();
      snapshots_->save(snapshot);
      job->finish(JobState::Completed);
    } catch (const LocalStoreError& e) {
      job->finish(JobState::Failed, e.what());
    }
  }

  JobSnapshot final_state = job->snapshot();
  std::cout << "Job for " << owner << " " << to_string(final_state.state) << ": "
            << final_state.processed << " processed, " << final_state.skipped << " skipped, "
            << final_state.failed << " failed, " << final_state.faces_stored << " faces stored"
            << std::endl;
}

}  // namespace facefind_core
