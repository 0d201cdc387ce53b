#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace facefind_core {

enum class JobState { Idle, Running, Completed, Failed, Cancelled };
std::string to_string(JobState state);

enum class ProcessingStep { Download = 0, Detect = 1, Embed = 2, Store = 3 };
constexpr size_t kProcessingStepCount = 4;
std::string to_string(ProcessingStep step);

enum class ItemOutcome { Processed, Skipped, Failed, Cancelled };

struct StepProgress {
  size_t total = 0;
  size_t completed = 0;
};

// A non-fatal problem tied to one source file.
struct JobIssue {
  std::string file_id;
  std::string photo_reference;
  ProcessingStep step = ProcessingStep::Download;
  std::string message;
};

struct JobSnapshot {
  std::string owner;
  std::string folder;
  JobState state = JobState::Idle;
  bool force_reprocess = false;
  std::optional<ProcessingStep> current_step;
  std::array<StepProgress, kProcessingStepCount> steps{};
  size_t total_items = 0;
  size_t processed = 0;
  size_t skipped = 0;
  size_t failed = 0;
  size_t cancelled = 0;
  size_t faces_stored = 0;
  double percent = 0.0;
  std::vector<JobIssue> warnings;
  std::vector<JobIssue> errors;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> finished_at;
  double elapsed_seconds = 0.0;
  std::optional<double> eta_seconds;
  bool source_unchanged = false;
  std::string failure_reason;

  const StepProgress& step(ProcessingStep s) const {
    return steps[static_cast<size_t>(s)];
  }
};

/**
 * @class ProcessingJob
 * @brief Status of one orchestration run, shared by the coordinator and workers.
 *
 * Every mutation takes the job mutex; snapshot() copies the whole state under
 * the same lock so readers never observe a half-applied update.
 */
class ProcessingJob {
 public:
  static constexpr size_t kEtaWindow = 20;

  ProcessingJob(std::string owner, std::string folder, bool force_reprocess, size_t worker_count);

  ProcessingJob(const ProcessingJob&) = delete;
  ProcessingJob& operator=(const ProcessingJob&) = delete;

  const std::string& owner() const {
    return owner_;
  }
  const std::string& folder() const {
    return folder_;
  }
  bool force_reprocess() const {
    return force_reprocess_;
  }

  // Called once the listing is known; sets every step total to `total_items`.
  void set_totals(size_t total_items, bool source_unchanged);

  void step_started(ProcessingStep step);
  void step_completed(ProcessingStep step);
  void add_faces_stored(size_t count);
  void add_warning(JobIssue issue);
  void add_error(JobIssue issue);

  // Marks one item as finished; counts and the ETA window are updated together.
  void item_finished(ItemOutcome outcome, std::chrono::steady_clock::duration duration);

  // Blocks until every item passed to set_totals() has finished.
  void wait_until_drained();

  void request_cancel();
  bool cancel_requested() const {
    return cancel_requested_.load();
  }

  // The local tier went away; the run stops and ends as failed.
  void record_fatal(const std::string& reason);

  void finish(JobState final_state, const std::string& reason = "");

  bool is_running() const;
  JobSnapshot snapshot() const;

 private:
  size_t finished_items_locked() const;

  const std::string owner_;
  const std::string folder_;
  const bool force_reprocess_;
  const size_t worker_count_;
  std::atomic<bool> cancel_requested_{false};

  mutable std::mutex mtx_;
  std::condition_variable drained_cv_;
  JobSnapshot state_;
  std::chrono::steady_clock::time_point started_steady_;
  std::optional<std::chrono::steady_clock::time_point> finished_steady_;
  std::deque<double> recent_item_seconds_;
};

}  // namespace facefind_core
