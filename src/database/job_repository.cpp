#include "database/job_repository.hpp"
#include "core/error_types.hpp"
#include "core/job_serializer.hpp"
#include "core/summary_modes.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
    {
        if (value)
            sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt, index);
    }
}

JobRepository::JobRepository(const std::string &db_path) : db_path_(db_path)
{
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw ResourceError("Failed to open job database " + db_path_ + ": " + message);
    }

    if (!executeStatement("PRAGMA journal_mode=WAL;"))
    {
        Logger::warn("Failed to enable WAL mode for " + db_path_);
    }
    executeStatement("PRAGMA synchronous=NORMAL;");
    createTables();

    write_thread_ = std::thread(&JobRepository::writeThreadWorker, this);
    Logger::info("Job database opened: " + db_path_);
}

JobRepository::~JobRepository()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
    if (write_thread_.joinable())
    {
        write_thread_.join();
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
        Logger::debug("Job database closed: " + db_path_);
    }
}

bool JobRepository::executeStatement(const std::string &sql)
{
    char *error_message = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_message);
    if (rc != SQLITE_OK)
    {
        Logger::error("SQL error: " + std::string(error_message ? error_message : "unknown"));
        sqlite3_free(error_message);
        return false;
    }
    return true;
}

void JobRepository::createTables()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS summary_jobs (
            id TEXT PRIMARY KEY,
            title TEXT NOT NULL,
            source_path TEXT NOT NULL,
            request_type TEXT NOT NULL,   -- text-prompt, category or time-range
            request_data TEXT NOT NULL,   -- JSON payload of the request
            selected_scenes TEXT NOT NULL DEFAULT '[]',
            summary_duration_seconds REAL,
            artifact TEXT,                -- JSON artifact handle, NULL until completed
            status TEXT NOT NULL DEFAULT 'queued',
            progress_percent INTEGER NOT NULL DEFAULT 0,
            error_kind TEXT,
            error_message TEXT,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_summary_jobs_status ON summary_jobs(status);
        CREATE INDEX IF NOT EXISTS idx_summary_jobs_created_at ON summary_jobs(created_at);
    )";
    if (!executeStatement(sql))
    {
        throw ResourceError("Could not create summary_jobs table in " + db_path_);
    }
}

void JobRepository::enqueue(WriteOperation operation)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push(std::move(operation));
    }
    queue_cv_.notify_one();
}

void JobRepository::save(const SummaryJob &job)
{
    json selection = JobSerializer::selectionToJson(job.selection);
    json scenes = json::array();
    for (const auto &scene : job.selected_scenes)
        scenes.push_back(JobSerializer::sceneToJson(scene));

    struct Row
    {
        std::string id, title, source_path, request_type, request_data, scenes, status;
        std::optional<std::string> artifact, error_kind, error_message;
        double summary_duration;
        int progress;
        std::string created_at, updated_at;
    };
    Row row{job.id,
            job.title,
            job.source_path,
            selection["mode"].get<std::string>(),
            selection["payload"].dump(),
            scenes.dump(),
            SummaryModes::getStatusName(job.status),
            job.artifact ? std::optional<std::string>(JobSerializer::artifactToJson(*job.artifact).dump())
                         : std::nullopt,
            job.error_kind,
            job.error_message,
            job.totalSelectedDuration(),
            job.progress_percent,
            JobSerializer::formatTimestamp(job.created_at),
            JobSerializer::formatTimestamp(job.updated_at)};

    enqueue([row](sqlite3 *db)
            {
        const char *sql = R"(
            INSERT OR REPLACE INTO summary_jobs
                (id, title, source_path, request_type, request_data, selected_scenes, summary_duration_seconds,
                 artifact, status, progress_percent, error_kind, error_message, created_at, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            throw std::runtime_error(std::string("Failed to prepare job upsert: ") + sqlite3_errmsg(db));
        }
        sqlite3_bind_text(stmt, 1, row.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, row.title.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, row.source_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, row.request_type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, row.request_data.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, row.scenes.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 7, row.summary_duration);
        bindOptionalText(stmt, 8, row.artifact);
        sqlite3_bind_text(stmt, 9, row.status.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 10, row.progress);
        bindOptionalText(stmt, 11, row.error_kind);
        bindOptionalText(stmt, 12, row.error_message);
        sqlite3_bind_text(stmt, 13, row.created_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 14, row.updated_at.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw std::runtime_error("Failed to store job " + row.id + ": " + sqlite3_errmsg(db));
        } });
}

void JobRepository::remove(const std::string &job_id)
{
    enqueue([job_id](sqlite3 *db)
            {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db, "DELETE FROM summary_jobs WHERE id = ?", -1, &stmt, nullptr) != SQLITE_OK)
        {
            throw std::runtime_error(std::string("Failed to prepare job delete: ") + sqlite3_errmsg(db));
        }
        sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw std::runtime_error("Failed to delete job " + job_id + ": " + sqlite3_errmsg(db));
        } });
}

void JobRepository::waitForWrites()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait(lock, [this]
                   { return (write_queue_.empty() && in_flight_ == 0) || should_stop_; });
}

void JobRepository::writeThreadWorker()
{
    while (true)
    {
        WriteOperation operation;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !write_queue_.empty() || should_stop_; });

            if (should_stop_ && write_queue_.empty())
            {
                break;
            }
            operation = std::move(write_queue_.front());
            write_queue_.pop();
            ++in_flight_;
        }

        try
        {
            std::lock_guard<std::mutex> db_lock(db_mutex_);
            operation(db_);
        }
        catch (const std::exception &e)
        {
            Logger::error("Job database write failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
            if (write_queue_.empty() && in_flight_ == 0)
            {
                queue_cv_.notify_all();
            }
        }
    }
}

SummaryJob JobRepository::jobFromRow(sqlite3_stmt *stmt)
{
    SummaryJob job;
    job.id = columnText(stmt, 0);
    job.title = columnText(stmt, 1);
    job.source_path = columnText(stmt, 2);
    job.selection = JobSerializer::selectionFromJson(
        json{{"mode", columnText(stmt, 3)}, {"payload", json::parse(columnText(stmt, 4))}});
    job.selected_scenes = JobSerializer::scenesFromJson(json::parse(columnText(stmt, 5)));
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL)
        job.artifact = JobSerializer::artifactFromJson(json::parse(columnText(stmt, 6)));

    auto status = SummaryModes::statusFromString(columnText(stmt, 7));
    if (!status)
    {
        throw std::runtime_error("Unknown job status '" + columnText(stmt, 7) + "'");
    }
    job.status = *status;
    job.progress_percent = sqlite3_column_int(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL)
        job.error_kind = columnText(stmt, 9);
    if (sqlite3_column_type(stmt, 10) != SQLITE_NULL)
        job.error_message = columnText(stmt, 10);
    job.created_at = JobSerializer::parseTimestamp(columnText(stmt, 11));
    job.updated_at = JobSerializer::parseTimestamp(columnText(stmt, 12));
    return job;
}

std::vector<SummaryJob> JobRepository::loadAll()
{
    waitForWrites();

    std::vector<SummaryJob> jobs;
    std::lock_guard<std::mutex> lock(db_mutex_);
    const char *sql = R"(
        SELECT id, title, source_path, request_type, request_data, selected_scenes, artifact,
               status, progress_percent, error_kind, error_message, created_at, updated_at
        FROM summary_jobs ORDER BY created_at, rowid
    )";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        throw ResourceError(std::string("Failed to query summary_jobs: ") + sqlite3_errmsg(db_));
    }

    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        try
        {
            jobs.push_back(jobFromRow(stmt));
        }
        catch (const std::exception &e)
        {
            Logger::warn("Skipping unreadable job record " + columnText(stmt, 0) + ": " + e.what());
        }
    }
    sqlite3_finalize(stmt);

    Logger::debug("Loaded " + std::to_string(jobs.size()) + " job records from " + db_path_);
    return jobs;
}
