#include "core/jobs/job_orchestrator.hpp"
#include "core/error_types.hpp"
#include "core/request_parser.hpp"
#include "core/summary_modes.hpp"
#include "logging/logger.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <cstdio>

JobOrchestrator::JobOrchestrator(const PipelineSettings &settings, std::shared_ptr<JobStore> store,
                                 std::shared_ptr<EmbeddingModelProvider> models,
                                 std::shared_ptr<ArtifactStore> artifacts)
    : settings_(settings),
      store_(store ? std::move(store) : std::make_shared<JobStore>()),
      artifacts_(artifacts),
      pipeline_(settings, std::move(models), std::move(artifacts)),
      arena_(std::max(1, settings.max_workers), 0)
{
    Logger::info("Job orchestrator started with " + std::to_string(std::max(1, settings.max_workers)) +
                 " workers");
}

JobOrchestrator::~JobOrchestrator()
{
    shutdown();
}

std::string JobOrchestrator::generateJobId()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
    {
        throw SummarizerError(ErrorKind::INTERNAL, "Could not generate a job id");
    }
    // RFC 4122 version 4 layout
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char text[37];
    std::snprintf(text, sizeof(text), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7], bytes[8],
                  bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return text;
}

std::string JobOrchestrator::submit(const CreateJobRequest &request)
{
    if (shutting_down_.load())
    {
        throw SummarizerError(ErrorKind::INTERNAL, "Job orchestrator is shutting down");
    }
    RequestParser::validate(request, settings_);

    SummaryJob job;
    job.id = generateJobId();
    job.title = request.title;
    job.source_path = request.source_path;
    job.selection = request.selection;
    job.status = JobStatus::QUEUED;
    job.created_at = std::chrono::system_clock::now();
    job.updated_at = job.created_at;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        tokens_[job.id] = std::make_shared<CancellationToken>();
        store_->create(job);
    }
    Logger::info("Job " + job.id + " queued: " +
                 SummaryModes::getModeName(SummaryModes::modeOf(job.selection)) + " summary of " +
                 job.source_path);
    schedule(job.id);
    return job.id;
}

std::optional<JobProgress> JobOrchestrator::progress(const std::string &id) const
{
    return store_->progress(id);
}

std::optional<SummaryJob> JobOrchestrator::result(const std::string &id) const
{
    return store_->get(id);
}

bool JobOrchestrator::cancel(const std::string &id)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto job = store_->get(id);
    if (!job || SummaryModes::isTerminal(job->status))
    {
        return false;
    }

    auto token = tokens_.find(id);
    if (token != tokens_.end())
    {
        token->second->cancel();
    }

    auto updated = store_->update(id, [](SummaryJob &record)
                                  {
        if (record.status == JobStatus::QUEUED)
        {
            record.status = JobStatus::CANCELLED;
            record.error_kind = ErrorKinds::getKindName(ErrorKind::CANCELLED);
            record.error_message = "Job cancelled before it started";
        } });

    if (updated && updated->status == JobStatus::CANCELLED)
    {
        Logger::info("Job " + id + " cancelled while queued");
        state_changed_.notify_all();
    }
    else
    {
        Logger::info("Cancellation requested for job " + id);
    }
    return true;
}

void JobOrchestrator::remove(const std::string &id)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto token = tokens_.find(id);
    if (token != tokens_.end())
    {
        token->second->cancel();
    }

    if (active_jobs_.count(id) > 0)
    {
        pending_removal_.insert(id);
        Logger::info("Job " + id + " will be removed once its worker has stopped");
        return;
    }

    deleteRecord(id);
    tokens_.erase(id);
    state_changed_.notify_all();
}

void JobOrchestrator::resubmit(const std::string &id)
{
    if (shutting_down_.load())
    {
        throw SummarizerError(ErrorKind::INTERNAL, "Job orchestrator is shutting down");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto job = store_->get(id);
        if (!job)
        {
            throw ValidationError("Unknown job: " + id);
        }
        if (!SummaryModes::isTerminal(job->status) || active_jobs_.count(id) > 0 || pending_removal_.count(id) > 0)
        {
            throw JobConflictError("Job " + id + " is still " + SummaryModes::getStatusName(job->status));
        }
        if (job->status == JobStatus::COMPLETED)
        {
            throw JobConflictError("Job " + id + " already completed");
        }
        if (!store_->reset(id, [](SummaryJob &record)
                           { record.created_at = std::chrono::system_clock::now(); }))
        {
            throw JobConflictError("Job " + id + " could not be reset");
        }
        tokens_[id] = std::make_shared<CancellationToken>();
    }

    Logger::info("Job " + id + " resubmitted");
    schedule(id);
}

bool JobOrchestrator::waitForCompletion(const std::string &id, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(state_mutex_);
    const bool settled = state_changed_.wait_for(lock, timeout, [this, &id]()
                                                 {
        auto job = store_->get(id);
        return !job || (SummaryModes::isTerminal(job->status) && active_jobs_.count(id) == 0); });
    return settled && store_->contains(id);
}

const std::vector<CategoryDefinition> &JobOrchestrator::listCategories()
{
    return CategoryCatalog::all();
}

void JobOrchestrator::shutdown()
{
    shutting_down_.store(true);

    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto &entry : tokens_)
            ids.push_back(entry.first);
    }
    for (const auto &id : ids)
    {
        cancel(id);
    }

    std::unique_lock<std::mutex> lock(state_mutex_);
    if (in_flight_ > 0)
    {
        Logger::info("Waiting for " + std::to_string(in_flight_) + " job tasks to stop");
    }
    state_changed_.wait(lock, [this]()
                        { return in_flight_ == 0; });
    Logger::debug("Job orchestrator stopped");
}

std::size_t JobOrchestrator::activeJobs() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_jobs_.size();
}

void JobOrchestrator::schedule(const std::string &id)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++in_flight_;
    }
    arena_.enqueue([this, id]()
                   { runJob(id); });
}

bool JobOrchestrator::tryAcquireJob(const std::string &id)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (active_jobs_.count(id) > 0)
    {
        Logger::debug("Job already running, skipping duplicate task: " + id);
        return false;
    }
    active_jobs_.insert(id);
    return true;
}

void JobOrchestrator::releaseJob(const std::string &id)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    active_jobs_.erase(id);
    if (pending_removal_.erase(id) > 0)
    {
        deleteRecord(id);
        tokens_.erase(id);
    }
    state_changed_.notify_all();
}

void JobOrchestrator::finishTask()
{
    // Notified under the lock: shutdown() may destroy this object as soon as it sees zero
    std::lock_guard<std::mutex> lock(state_mutex_);
    --in_flight_;
    state_changed_.notify_all();
}

std::shared_ptr<CancellationToken> JobOrchestrator::tokenFor(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = tokens_.find(id);
    return it != tokens_.end() ? it->second : nullptr;
}

void JobOrchestrator::deleteRecord(const std::string &id)
{
    auto job = store_->get(id);
    if (!job)
        return;

    if (job->artifact && !artifacts_->remove(job->artifact->uri))
    {
        Logger::warn("Could not delete artifact of job " + id + ": " + job->artifact->uri);
    }
    store_->remove(id);
    Logger::info("Job " + id + " removed");
}

void JobOrchestrator::runJob(const std::string &id)
{
    try
    {
        if (tryAcquireJob(id))
        {
            auto token = tokenFor(id);
            auto started = store_->update(id, [](SummaryJob &record)
                                          {
                if (record.status == JobStatus::QUEUED)
                    record.status = JobStatus::PROCESSING; });

            if (started && started->status == JobStatus::PROCESSING)
            {
                if (!token)
                {
                    token = std::make_shared<CancellationToken>();
                }
                Logger::info("Job " + id + " processing");
                executeJob(id, *started, *token);
            }
            releaseJob(id);
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Job task " + id + " ended abnormally: " + std::string(e.what()));
        abandonJob(id, e.what());
    }
    finishTask();
}

void JobOrchestrator::abandonJob(const std::string &id, const std::string &message)
{
    try
    {
        store_->update(id, [&message](SummaryJob &record)
                       {
            if (!SummaryModes::isTerminal(record.status))
            {
                record.status = JobStatus::FAILED;
                record.error_kind = ErrorKinds::getKindName(ErrorKind::INTERNAL);
                record.error_message = message;
            } });
    }
    catch (const std::exception &e)
    {
        Logger::error("Could not mark job " + id + " failed: " + std::string(e.what()));
    }

    try
    {
        releaseJob(id);
    }
    catch (const std::exception &e)
    {
        Logger::error("Could not release job " + id + ": " + std::string(e.what()));
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_jobs_.erase(id);
        state_changed_.notify_all();
    }
}

void JobOrchestrator::executeJob(const std::string &id, const SummaryJob &job, const CancellationToken &token)
{
    auto markTerminal = [this, &id](JobStatus status, ErrorKind kind, const std::string &message)
    {
        store_->update(id, [status, kind, &message](SummaryJob &record)
                       {
            record.status = status;
            record.error_kind = ErrorKinds::getKindName(kind);
            record.error_message = message; });
    };

    try
    {
        PipelineOutcome outcome = pipeline_.run(id, job.source_path, job.selection, token, [this, &id](int percent)
                                                {
            store_->update(id, [percent](SummaryJob &record)
                           { record.progress_percent = std::max(record.progress_percent, percent); }); });

        store_->update(id, [&outcome](SummaryJob &record)
                       {
            record.status = JobStatus::COMPLETED;
            record.progress_percent = ProgressCheckpoints::kCompleted;
            record.selected_scenes = outcome.selected_scenes;
            record.artifact = outcome.artifact; });
        Logger::info("Job " + id + " completed: " + outcome.artifact.uri);
    }
    catch (const CancelledError &e)
    {
        markTerminal(JobStatus::CANCELLED, ErrorKind::CANCELLED, e.what());
        Logger::info("Job " + id + " cancelled: " + std::string(e.what()));
    }
    catch (const SummarizerError &e)
    {
        markTerminal(JobStatus::FAILED, e.kind(), e.what());
        Logger::error("Job " + id + " failed (" + ErrorKinds::getKindName(e.kind()) + "): " + e.what());
    }
    catch (const std::exception &e)
    {
        markTerminal(JobStatus::FAILED, ErrorKind::INTERNAL, e.what());
        Logger::error("Job " + id + " failed (internal): " + std::string(e.what()));
    }
}
