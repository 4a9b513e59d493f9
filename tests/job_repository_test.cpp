#include "test_base.hpp"
#include "core/error_types.hpp"
#include "core/jobs/job_store.hpp"
#include "database/job_repository.hpp"
#include <memory>

class JobRepositoryTest : public TestBase
{
protected:
    std::string dbPath() const { return testPath("jobs.db"); }

    static SummaryJob job(const std::string &id, JobStatus status)
    {
        SummaryJob record;
        record.id = id;
        record.title = "Holiday " + id;
        record.source_path = "/videos/" + id + ".mp4";
        record.selection = TimeRangeRequest{{{0.0, 25.0}, {50.0, 75.0}}};
        record.status = status;
        record.created_at = std::chrono::system_clock::now();
        record.updated_at = record.created_at;
        return record;
    }
};

TEST_F(JobRepositoryTest, RecordsSurviveReopening)
{
    {
        JobRepository repository(dbPath());
        SummaryJob completed = job("done", JobStatus::COMPLETED);
        completed.progress_percent = 100;
        SceneCandidate scene;
        scene.start = 0.0;
        scene.end = 25.0;
        scene.confidence = 1.0;
        scene.label = std::string("0.0%-25.0%");
        completed.selected_scenes.push_back(scene);
        ArtifactRef artifact;
        artifact.uri = "/artifacts/done.mp4";
        artifact.size_bytes = 1234;
        artifact.duration_seconds = 25.0;
        artifact.sha256 = std::string(64, 'a');
        artifact.format = "mp4";
        completed.artifact = artifact;
        repository.save(completed);
        repository.waitForWrites();
    }

    JobRepository reopened(dbPath());
    auto records = reopened.loadAll();
    ASSERT_EQ(records.size(), 1u);
    const SummaryJob &record = records[0];
    EXPECT_EQ(record.id, "done");
    EXPECT_EQ(record.title, "Holiday done");
    EXPECT_EQ(record.status, JobStatus::COMPLETED);
    EXPECT_EQ(record.progress_percent, 100);
    ASSERT_TRUE(std::holds_alternative<TimeRangeRequest>(record.selection));
    EXPECT_EQ(std::get<TimeRangeRequest>(record.selection).ranges.size(), 2u);
    ASSERT_EQ(record.selected_scenes.size(), 1u);
    EXPECT_DOUBLE_EQ(record.selected_scenes[0].end, 25.0);
    ASSERT_TRUE(record.artifact.has_value());
    EXPECT_EQ(record.artifact->uri, "/artifacts/done.mp4");
    EXPECT_EQ(record.artifact->size_bytes, 1234u);
}

TEST_F(JobRepositoryTest, SaveReplacesAndRemoveDeletes)
{
    JobRepository repository(dbPath());
    SummaryJob record = job("a", JobStatus::QUEUED);
    repository.save(record);
    record.status = JobStatus::FAILED;
    record.error_kind = std::string("no_match");
    record.error_message = std::string("No scene reached the similarity threshold");
    repository.save(record);
    repository.save(job("b", JobStatus::CANCELLED));
    repository.remove("b");

    auto records = repository.loadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, JobStatus::FAILED);
    EXPECT_EQ(*records[0].error_kind, "no_match");
}

TEST_F(JobRepositoryTest, RestoreFailsInterruptedJobs)
{
    {
        auto repository = std::make_shared<JobRepository>(dbPath());
        repository->save(job("queued", JobStatus::QUEUED));
        repository->save(job("running", JobStatus::PROCESSING));
        repository->save(job("done", JobStatus::COMPLETED));
        repository->waitForWrites();
    }

    auto repository = std::make_shared<JobRepository>(dbPath());
    JobStore store(repository);
    EXPECT_EQ(store.restore(), 3u);

    for (const std::string id : {"queued", "running"})
    {
        auto record = store.get(id);
        ASSERT_TRUE(record.has_value()) << id;
        EXPECT_EQ(record->status, JobStatus::FAILED) << id;
        EXPECT_EQ(*record->error_kind, "internal") << id;
        ASSERT_TRUE(record->error_message.has_value());
    }
    EXPECT_EQ(store.get("done")->status, JobStatus::COMPLETED);

    // The failure was written back
    store.flush();
    auto persisted = repository->loadAll();
    for (const auto &record : persisted)
    {
        EXPECT_TRUE(record.status == JobStatus::FAILED || record.status == JobStatus::COMPLETED);
    }
}

TEST_F(JobRepositoryTest, StoreWritesThrough)
{
    auto repository = std::make_shared<JobRepository>(dbPath());
    JobStore store(repository);
    store.create(job("a", JobStatus::QUEUED));
    store.update("a", [](SummaryJob &record)
                 {
        record.status = JobStatus::PROCESSING;
        record.progress_percent = 40; });
    store.create(job("b", JobStatus::QUEUED));
    store.remove("b");
    store.flush();

    auto records = repository->loadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, JobStatus::PROCESSING);
    EXPECT_EQ(records[0].progress_percent, 40);
}

TEST_F(JobRepositoryTest, UnopenableDatabaseIsAResourceError)
{
    EXPECT_THROW({ JobRepository repository(testPath("missing_dir/sub/jobs.db")); }, ResourceError);
}
