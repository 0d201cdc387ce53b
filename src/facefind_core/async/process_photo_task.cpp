#include "facefind_core/async/process_photo_task.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <vector>

#include "facefind_core/async/deadline.hpp"
#include "facefind_core/async/service_provider.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include "facefind_core/recognition/embedding_producer.hpp"
#include "facefind_core/services/content_cache.hpp"
#include "facefind_core/services/embedding_store.hpp"
#include "facefind_core/sources/photo_source.hpp"

namespace facefind_core {

ProcessPhotoTask::ProcessPhotoTask(std::shared_ptr<ProcessingJob> job,
                                   SourceFile file,
                                   std::chrono::milliseconds item_timeout)
    : job_(std::move(job)),
      file_(std::move(file)),
      photo_reference_(make_photo_reference(job_->folder(), file_.id)),
      item_timeout_(item_timeout) {}

std::string ProcessPhotoTask::make_photo_reference(const std::string& scope,
                                                   const std::string& file_id) {
  return scope + "/" + file_id;
}

JobIssue ProcessPhotoTask::issue(ProcessingStep step, const std::string& message) const {
  JobIssue issue;
  issue.file_id = file_.id;
  issue.photo_reference = photo_reference_;
  issue.step = step;
  issue.message = message;
  return issue;
}

void ProcessPhotoTask::skip_remaining_steps() {
  job_->step_completed(ProcessingStep::Detect);
  job_->step_completed(ProcessingStep::Embed);
  job_->step_completed(ProcessingStep::Store);
}

void ProcessPhotoTask::execute(ServiceProvider& services) {
  const auto started = std::chrono::steady_clock::now();
  auto elapsed = [&started] { return std::chrono::steady_clock::now() - started; };

  if (job_->cancel_requested()) {
    job_->item_finished(ItemOutcome::Cancelled, elapsed());
    return;
  }

  const std::string& owner = job_->owner();
  const std::string& scope = job_->folder();
  ProcessingStep step = ProcessingStep::Download;

  try {
    // 1. Make sure a complete local copy exists
    job_->step_started(step);
    ContentCache& cache = services.get_content_cache();
    std::optional<CacheEntry> cached = cache.lookup(owner, scope, file_.id);
    const bool changed = cached && (cached->modified_marker != file_.modified_marker ||
                                    (file_.byte_size > 0 && cached->byte_size != file_.byte_size));

    std::filesystem::path local_path;
    try {
      std::shared_ptr<ContentCache> shared_cache = services.get_content_cache_ptr();
      std::shared_ptr<PhotoSource> source = services.get_photo_source_ptr();
      local_path = async::run_with_deadline(
          [shared_cache, source, owner, scope, file = file_, changed] {
            return changed ? shared_cache->force_refetch(owner, scope, file, *source)
                           : shared_cache->fetch(owner, scope, file, *source);
          },
          item_timeout_, services.get_call_slots());
    } catch (const ContentCacheError& e) {
      job_->add_error(issue(step, e.what()));
      job_->item_finished(ItemOutcome::Failed, elapsed());
      return;
    } catch (const ItemTimeoutError& e) {
      job_->add_error(issue(step, std::string("Download ") + e.what()));
      job_->item_finished(ItemOutcome::Failed, elapsed());
      return;
    }
    job_->step_completed(step);

    // 2. Skip photos that already have a stored face set
    EmbeddingStore& store = services.get_embedding_store();
    if (!job_->force_reprocess() && !changed && store.exists(owner, photo_reference_)) {
      skip_remaining_steps();
      job_->item_finished(ItemOutcome::Skipped, elapsed());
      return;
    }

    // 3. Detection and embedding happen in one call to the recognition engine
    step = ProcessingStep::Detect;
    job_->step_started(step);
    std::vector<std::vector<float>> vectors;
    try {
      auto image = std::make_shared<std::vector<unsigned char>>(ContentCache::read_file(local_path));
      std::shared_ptr<EmbeddingProducer> producer = services.get_embedding_producer();
      vectors = async::run_with_deadline(
          [producer, image] { return producer->detect_and_embed(*image); }, item_timeout_,
          services.get_call_slots());
    } catch (const EmbeddingProducerError& e) {
      job_->add_warning(issue(step, e.what()));
      job_->item_finished(ItemOutcome::Failed, elapsed());
      return;
    } catch (const ItemTimeoutError& e) {
      job_->add_warning(issue(step, std::string("Recognition ") + e.what()));
      job_->item_finished(ItemOutcome::Failed, elapsed());
      return;
    } catch (const ContentCacheError& e) {
      job_->add_warning(issue(step, e.what()));
      job_->item_finished(ItemOutcome::Failed, elapsed());
      return;
    }
    job_->step_completed(step);

    step = ProcessingStep::Embed;
    job_->step_started(step);
    if (vectors.empty()) {
      job_->add_warning(issue(ProcessingStep::Detect, "No faces detected"));
    }
    job_->step_completed(step);

    // 4. Replace whatever was stored before; the skip check above already ran
    step = ProcessingStep::Store;
    job_->step_started(step);
    PutResult put = store.put(owner, photo_reference_, vectors, /*force*/ true);
    if (put.remote_error) {
      job_->add_warning(issue(step, "Remote tier write failed: " + *put.remote_error));
    }
    job_->add_faces_stored(put.faces_written);
    job_->step_completed(step);
    job_->item_finished(ItemOutcome::Processed, elapsed());
  } catch (const LocalStoreError& e) {
    job_->add_error(issue(step, e.what()));
    if (e.is_outage()) {
      std::cerr << "ProcessPhotoTask: local store unavailable, stopping job for " << owner << ": "
                << e.what() << std::endl;
      job_->record_fatal(e.what());
    }
    job_->item_finished(ItemOutcome::Failed, elapsed());
  } catch (const std::exception& e) {
    job_->add_error(issue(step, e.what()));
    job_->item_finished(ItemOutcome::Failed, elapsed());
  }
}

}  // namespace facefind_core
