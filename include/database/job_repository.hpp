#pragma once

#include "core/summary_types.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <sqlite3.h>

/**
 * @brief SQLite persistence of summary job records
 *
 * Writes are queued and applied by one background thread so a job stage never
 * waits on the disk. Reads wait for queued writes first.
 */
class JobRepository
{
public:
    /**
     * @brief Open (or create) the database and its summary_jobs table
     * @throws ResourceError when the database cannot be opened
     */
    explicit JobRepository(const std::string &db_path);
    ~JobRepository();

    JobRepository(const JobRepository &) = delete;
    JobRepository &operator=(const JobRepository &) = delete;

    // Queue an insert-or-replace of the full record
    void save(const SummaryJob &job);

    // Queue deletion of a record
    void remove(const std::string &job_id);

    /**
     * @brief Every stored record, oldest first
     */
    std::vector<SummaryJob> loadAll();

    // Block until every queued write has been applied
    void waitForWrites();

    const std::string &path() const { return db_path_; }

private:
    using WriteOperation = std::function<void(sqlite3 *)>;

    void enqueue(WriteOperation operation);
    void writeThreadWorker();
    void createTables();
    bool executeStatement(const std::string &sql);
    static SummaryJob jobFromRow(sqlite3_stmt *stmt);

    std::string db_path_;
    sqlite3 *db_ = nullptr;
    std::mutex db_mutex_;

    std::queue<WriteOperation> write_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread write_thread_;
    std::atomic<bool> should_stop_{false};
    std::size_t in_flight_ = 0;
};
