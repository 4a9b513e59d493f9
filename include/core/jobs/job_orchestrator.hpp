#pragma once

#include "core/cancellation_token.hpp"
#include "core/category_catalog.hpp"
#include "core/jobs/job_store.hpp"
#include "core/jobs/summarization_pipeline.hpp"
#include "core/pipeline_settings.hpp"
#include "core/summary_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tbb/task_arena.h>
#include <vector>

/**
 * @brief Accepts summarization requests and runs them as background jobs
 *
 * Jobs run on a bounded oneTBB arena, one task per job, each job end to end
 * on a single worker. State lives in the JobStore; callers poll it through
 * progress() and result(). Cancellation is cooperative and observed at stage
 * boundaries.
 */
class JobOrchestrator
{
public:
    JobOrchestrator(const PipelineSettings &settings, std::shared_ptr<JobStore> store,
                    std::shared_ptr<EmbeddingModelProvider> models, std::shared_ptr<ArtifactStore> artifacts);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator &) = delete;
    JobOrchestrator &operator=(const JobOrchestrator &) = delete;

    /**
     * @brief Validate a request, record it as queued and schedule it
     * @return Id of the new job
     * @throws ValidationError for a malformed request; no job is created
     */
    std::string submit(const CreateJobRequest &request);

    std::optional<JobProgress> progress(const std::string &id) const;
    std::optional<SummaryJob> result(const std::string &id) const;

    /**
     * @brief Request cancellation
     *
     * A queued job is cancelled at once; a processing job stops at its next
     * stage boundary. Terminal and unknown jobs are left alone.
     * @return true if the job was still active
     */
    bool cancel(const std::string &id);

    /**
     * @brief Cancel if active, then delete the record and its artifact
     *
     * For a running job the deletion happens once its worker has cleaned up.
     * Removing an unknown id does nothing.
     */
    void remove(const std::string &id);

    /**
     * @brief Run a failed or cancelled job again from the start
     * @throws JobConflictError while the job is queued or processing, or already completed
     * @throws ValidationError for an unknown id
     */
    void resubmit(const std::string &id);

    /**
     * @brief Block until the job is terminal and its worker has finished
     * @return false on timeout or for an unknown id
     */
    bool waitForCompletion(const std::string &id, std::chrono::milliseconds timeout);

    static const std::vector<CategoryDefinition> &listCategories();

    /**
     * @brief Stop accepting jobs, cancel every active one and wait for the workers
     */
    void shutdown();

    std::size_t activeJobs() const;

    static std::string generateJobId();

private:
    void schedule(const std::string &id);
    void runJob(const std::string &id);
    void executeJob(const std::string &id, const SummaryJob &job, const CancellationToken &token);
    void finishTask();

    bool tryAcquireJob(const std::string &id);
    void releaseJob(const std::string &id);
    // Fails a job whose task ended with an exception outside the pipeline
    void abandonJob(const std::string &id, const std::string &message);
    std::shared_ptr<CancellationToken> tokenFor(const std::string &id) const;

    // Deletes the artifact and the record; caller holds no store lock
    void deleteRecord(const std::string &id);

    PipelineSettings settings_;
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<ArtifactStore> artifacts_;
    SummarizationPipeline pipeline_;

    tbb::task_arena arena_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_changed_;
    std::map<std::string, std::shared_ptr<CancellationToken>> tokens_;
    std::set<std::string> active_jobs_;
    std::set<std::string> pending_removal_;
    std::size_t in_flight_ = 0;
    std::atomic<bool> shutting_down_{false};
};
