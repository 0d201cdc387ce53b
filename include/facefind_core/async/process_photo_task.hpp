#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "facefind_core/async/ITask.hpp"
#include "facefind_core/progress/processing_job.hpp"
#include "facefind_core/types/source_file.hpp"

namespace facefind_core {

/**
 * @class ProcessPhotoTask
 * @brief Runs the per-file pipeline for one photo of a job:
 * cache -> already-stored check -> detect/embed -> store.
 *
 * Failures are recorded on the job as warnings or errors and never escape
 * execute(), so one bad file cannot stop the rest of the batch.
 */
class ProcessPhotoTask : public ITask {
public:
    ProcessPhotoTask(std::shared_ptr<ProcessingJob> job,
                     SourceFile file,
                     std::chrono::milliseconds item_timeout);

    void execute(ServiceProvider& services) override;
    const char* get_type() const override { return "PROCESS_PHOTO"; }

    const std::string& get_photo_reference() const { return photo_reference_; }

    static std::string make_photo_reference(const std::string& scope, const std::string& file_id);

private:
    JobIssue issue(ProcessingStep step, const std::string& message) const;
    void skip_remaining_steps();

    std::shared_ptr<ProcessingJob> job_;
    SourceFile file_;
    std::string photo_reference_;
    std::chrono::milliseconds item_timeout_;
};
}  // namespace facefind_core
