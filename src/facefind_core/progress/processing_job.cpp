#include "facefind_core/progress/processing_job.hpp"

#include <numeric>

namespace facefind_core {

std::string to_string(JobState state) {
  switch (state) {
    case JobState::Idle:
      return "idle";
    case JobState::Running:
      return "running";
    case JobState::Completed:
      return "completed";
    case JobState::Failed:
      return "failed";
    case JobState::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

std::string to_string(ProcessingStep step) {
  switch (step) {
    case ProcessingStep::Download:
      return "download";
    case ProcessingStep::Detect:
      return "detect";
    case ProcessingStep::Embed:
      return "embed";
    case ProcessingStep::Store:
      return "store";
    default:
      return "unknown";
  }
}

ProcessingJob::ProcessingJob(std::string owner,
                             std::string folder,
                             bool force_reprocess,
                             size_t worker_count)
    : owner_(std::move(owner)),
      folder_(std::move(folder)),
      force_reprocess_(force_reprocess),
      worker_count_(worker_count == 0 ? 1 : worker_count),
      started_steady_(std::chrono::steady_clock::now()) {
  state_.owner = owner_;
  state_.folder = folder_;
  state_.force_reprocess = force_reprocess_;
  state_.state = JobState::Running;
  state_.started_at = std::chrono::system_clock::now();
}

void ProcessingJob::set_totals(size_t total_items, bool source_unchanged) {
  std::lock_guard<std::mutex> lock(mtx_);
  state_.total_items = total_items;
  state_.source_unchanged = source_unchanged;
  for (auto& step : state_.steps) {
    step.total = total_items;
  }
  drained_cv_.notify_all();
}

void ProcessingJob::step_started(ProcessingStep step) {
  std::lock_guard<std::mutex> lock(mtx_);
  state_.current_step = step;
}

void ProcessingJob::step_completed(ProcessingStep step) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& progress = state_.steps[static_cast<size_t>(step)];
  if (progress.completed < progress.total) {
    ++progress.completed;
  }
}

void ProcessingJob::add_faces_stored(size_t count) {
  std::lock_guard<std::mutex> lock(mtx_);
  state_.faces_stored += count;
}

void ProcessingJob::add_warning(JobIssue issue) {
  std::lock_guard<std::mutex> lock(mtx_);
  state_.warnings.push_back(std::move(issue));
}

void ProcessingJob::add_error(JobIssue issue) {
  std::lock_guard<std::mutex> lock(mtx_);
  state_.errors.push_back(std::move(issue));
}

size_t ProcessingJob::finished_items_locked() const {
  return state_.processed + state_.skipped + state_.failed + state_.cancelled;
}

void ProcessingJob::item_finished(ItemOutcome outcome, std::chrono::steady_clock::duration duration) {
  std::lock_guard<std::mutex> lock(mtx_);
  switch (outcome) {
    case ItemOutcome::Processed:
      ++state_.processed;
      break;
    case ItemOutcome::Skipped:
      ++state_.skipped;
      break;
    case ItemOutcome::Failed:
      ++state_.failed;
      break;
    case ItemOutcome::Cancelled:
      ++state_.cancelled;
      break;
  }

  // Skips are near-instant and would drag the estimate towards zero
  if (outcome == ItemOutcome::Processed || outcome == ItemOutcome::Failed) {
    recent_item_seconds_.push_back(std::chrono::duration<double>(duration).count());
    if (recent_item_seconds_.size() > kEtaWindow) {
      recent_item_seconds_.pop_front();
    }
  }

  if (finished_items_locked() >= state_.total_items) {
    drained_cv_.notify_all();
  }
}

void ProcessingJob::wait_until_drained() {
  std::unique_lock<std::mutex> lock(mtx_);
  drained_cv_.wait(lock, [this] { return finished_items_locked() >= state_.total_items; });
}

void ProcessingJob::request_cancel() {
  cancel_requested_.store(true);
}

void ProcessingJob::record_fatal(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (state_.failure_reason.empty()) {
      state_.failure_reason = reason;
    }
  }
  request_cancel();
}

void ProcessingJob::finish(JobState final_state, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (state_.state != JobState::Running) {
    return;
  }
  state_.state = final_state;
  if (!reason.empty()) {
    state_.failure_reason = reason;
  }
  state_.current_step.reset();
  state_.finished_at = std::chrono::system_clock::now();
  finished_steady_ = std::chrono::steady_clock::now();
}

bool ProcessingJob::is_running() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_.state == JobState::Running;
}

JobSnapshot ProcessingJob::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  JobSnapshot copy = state_;

  const auto end = finished_steady_.value_or(std::chrono::steady_clock::now());
  copy.elapsed_seconds = std::chrono::duration<double>(end - started_steady_).count();

  const size_t finished = finished_items_locked();
  if (copy.total_items == 0) {
    copy.percent = copy.state == JobState::Running ? 0.0 : 100.0;
  } else {
    copy.percent = 100.0 * static_cast<double>(finished) / static_cast<double>(copy.total_items);
  }

  if (copy.state == JobState::Running && !recent_item_seconds_.empty() &&
      finished < copy.total_items) {
    const double average =
        std::accumulate(recent_item_seconds_.begin(), recent_item_seconds_.end(), 0.0) /
        static_cast<double>(recent_item_seconds_.size());
    const double remaining = static_cast<double>(copy.total_items - finished);
    copy.eta_seconds = average * remaining / static_cast<double>(worker_count_);
  } else if (copy.state != JobState::Running) {
    copy.eta_seconds = 0.0;
  }
  return copy;
}

}  // namespace facefind_core
