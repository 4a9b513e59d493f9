#include "core/jobs/job_store.hpp"
#include "core/error_types.hpp"
#include "core/summary_modes.hpp"
#include "database/job_repository.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <mutex>

namespace
{
    const char *kInterruptedMessage = "Interrupted by server restart";
}

JobStore::JobStore(std::shared_ptr<JobRepository> repository) : repository_(std::move(repository)) {}

std::size_t JobStore::restore()
{
    if (!repository_)
        return 0;

    auto records = repository_->loadAll();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto &job : records)
    {
        if (!SummaryModes::isTerminal(job.status))
        {
            job.status = JobStatus::FAILED;
            job.error_kind = ErrorKinds::getKindName(ErrorKind::INTERNAL);
            job.error_message = kInterruptedMessage;
            job.updated_at = std::chrono::system_clock::now();
            Logger::warn("Job " + job.id + " was interrupted by a restart, marked failed");
            persist(job);
        }
        jobs_[job.id] = job;
    }
    Logger::info("Restored " + std::to_string(records.size()) + " job records");
    return records.size();
}

void JobStore::persist(const SummaryJob &job)
{
    if (repository_)
        repository_->save(job);
}

void JobStore::create(const SummaryJob &job)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    jobs_[job.id] = job;
    persist(job);
}

std::optional<SummaryJob> JobStore::get(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
        return std::nullopt;
    return it->second;
}

std::optional<JobProgress> JobStore::progress(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
        return std::nullopt;

    JobProgress progress;
    progress.status = it->second.status;
    progress.progress_percent = it->second.progress_percent;
    progress.error_message = it->second.error_message;
    return progress;
}

std::vector<SummaryJob> JobStore::list() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SummaryJob> jobs;
    jobs.reserve(jobs_.size());
    for (const auto &entry : jobs_)
        jobs.push_back(entry.second);
    std::sort(jobs.begin(), jobs.end(), [](const SummaryJob &a, const SummaryJob &b)
              { return a.created_at < b.created_at; });
    return jobs;
}

bool JobStore::contains(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return jobs_.count(id) > 0;
}

std::optional<SummaryJob> JobStore::update(const std::string &id, const Mutation &mutation)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
        return std::nullopt;

    const SummaryJob &current = it->second;
    SummaryJob candidate = current;
    mutation(candidate);

    if (SummaryModes::isTerminal(current.status) && candidate.status != current.status)
    {
        Logger::debug("Ignoring change of terminal job " + id + " to " +
                      SummaryModes::getStatusName(candidate.status));
        return std::nullopt;
    }
    if (!SummaryModes::isTerminal(candidate.status) && candidate.progress_percent < current.progress_percent)
    {
        Logger::debug("Ignoring progress regression of job " + id);
        return std::nullopt;
    }
    candidate.progress_percent = std::clamp(candidate.progress_percent, 0, 100);
    candidate.updated_at = std::chrono::system_clock::now();

    it->second = candidate;
    // Queued under the lock so the repository sees changes of one job in order
    persist(candidate);
    return candidate;
}

bool JobStore::reset(const std::string &id, const Mutation &mutation)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || !SummaryModes::isTerminal(it->second.status))
        return false;

    SummaryJob fresh = it->second;
    fresh.status = JobStatus::QUEUED;
    fresh.progress_percent = 0;
    fresh.selected_scenes.clear();
    fresh.artifact.reset();
    fresh.error_kind.reset();
    fresh.error_message.reset();
    mutation(fresh);
    fresh.updated_at = std::chrono::system_clock::now();

    it->second = fresh;
    persist(fresh);
    return true;
}

bool JobStore::remove(const std::string &id)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool erased = jobs_.erase(id) > 0;
    if (erased && repository_)
        repository_->remove(id);
    return erased;
}

void JobStore::flush()
{
    if (repository_)
        repository_->waitForWrites();
}
