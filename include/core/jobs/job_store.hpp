#pragma once

#include "core/summary_types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

class JobRepository;

/**
 * @brief Authoritative in-memory table of summary jobs
 *
 * Readers get copies taken under a shared lock; every update runs a mutation
 * on a copy under the exclusive lock and publishes it whole, so no reader
 * sees a half-applied change. Changes are written through to the repository
 * when one is attached.
 */
class JobStore
{
public:
    using Mutation = std::function<void(SummaryJob &)>;

    explicit JobStore(std::shared_ptr<JobRepository> repository = nullptr);
    virtual ~JobStore() = default;

    /**
     * @brief Load persisted records; jobs a previous process left running become failed
     * @return Number of records loaded
     */
    std::size_t restore();

    // Insert a new record; an existing id is replaced
    void create(const SummaryJob &job);

    std::optional<SummaryJob> get(const std::string &id) const;
    std::optional<JobProgress> progress(const std::string &id) const;
    std::vector<SummaryJob> list() const;
    bool contains(const std::string &id) const;

    /**
     * @brief Apply a mutation atomically
     *
     * Rejected (record left unchanged) when the record is terminal and the
     * mutation would change its status, or when progress would go down while
     * the job is not terminal.
     * @return The published record, or std::nullopt for an unknown id or a rejected change
     */
    virtual std::optional<SummaryJob> update(const std::string &id, const Mutation &mutation);

    /**
     * @brief Replace a terminal record by a fresh queued one, as for a re-run
     * @return false if the id is unknown or the job is still active
     */
    bool reset(const std::string &id, const Mutation &mutation);

    bool remove(const std::string &id);

    void flush();

private:
    void persist(const SummaryJob &job);

    std::shared_ptr<JobRepository> repository_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, SummaryJob> jobs_;
};
