#include <gtest/gtest.h>
#include "core/job_serializer.hpp"
#include <chrono>

using json = nlohmann::json;

namespace
{
    SummaryJob completedJob()
    {
        SummaryJob job;
        job.id = "job-1";
        job.title = "Sunsets";
        job.source_path = "/videos/beach.mp4";
        job.selection = TextPromptRequest{"sunset"};
        job.status = JobStatus::COMPLETED;
        job.progress_percent = 100;
        job.selected_scenes = {SceneCandidate{5.0, 15.0, 0.9, std::string("sunset")},
                               SceneCandidate{30.0, 34.5, 0.7, std::nullopt}};
        job.artifact = ArtifactRef{"file:///summaries/job-1.mp4", 2048, 14.5, "abc123", "mp4"};
        job.created_at = JobSerializer::parseTimestamp("2024-03-01T10:00:00Z");
        job.updated_at = JobSerializer::parseTimestamp("2024-03-01T10:02:30Z");
        return job;
    }
}

TEST(JobSerializerTest, CompletedJobShape)
{
    json j = JobSerializer::jobToJson(completedJob());

    EXPECT_EQ(j["id"], "job-1");
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["progress_percent"], 100);
    EXPECT_EQ(j["request"]["mode"], "text-prompt");
    EXPECT_EQ(j["request"]["payload"]["prompt"], "sunset");
    ASSERT_EQ(j["selected_scenes"].size(), 2u);
    EXPECT_DOUBLE_EQ(j["selected_scenes"][0]["duration"].get<double>(), 10.0);
    EXPECT_EQ(j["selected_scenes"][0]["matched_label"], "sunset");
    EXPECT_TRUE(j["selected_scenes"][1]["matched_label"].is_null());
    EXPECT_DOUBLE_EQ(j["summary_duration"].get<double>(), 14.5);
    EXPECT_EQ(j["artifact"]["size_bytes"], 2048);
    EXPECT_TRUE(j["error_message"].is_null());
    EXPECT_EQ(j["created_at"], "2024-03-01T10:00:00Z");
    EXPECT_EQ(j["updated_at"], "2024-03-01T10:02:30Z");
}

TEST(JobSerializerTest, SerializingTwiceIsIdentical)
{
    SummaryJob job = completedJob();
    EXPECT_EQ(JobSerializer::jobToJson(job).dump(), JobSerializer::jobToJson(job).dump());
}

TEST(JobSerializerTest, ProgressOmitsMissingError)
{
    JobProgress running{JobStatus::PROCESSING, 40, std::nullopt};
    json j = JobSerializer::progressToJson(running);
    EXPECT_EQ(j["status"], "processing");
    EXPECT_EQ(j["progress_percent"], 40);
    EXPECT_FALSE(j.contains("error_message"));

    JobProgress failed{JobStatus::FAILED, 10, std::string("Source video is corrupt")};
    EXPECT_EQ(JobSerializer::progressToJson(failed)["error_message"], "Source video is corrupt");
}

TEST(JobSerializerTest, SelectionsReadBack)
{
    SelectionRequest ranges = TimeRangeRequest{{{0.0, 25.0}, {50.0, 75.0}}};
    SelectionRequest back = JobSerializer::selectionFromJson(JobSerializer::selectionToJson(ranges));
    ASSERT_TRUE(std::holds_alternative<TimeRangeRequest>(back));
    ASSERT_EQ(std::get<TimeRangeRequest>(back).ranges.size(), 2u);
    EXPECT_DOUBLE_EQ(std::get<TimeRangeRequest>(back).ranges[1].end_percent, 75.0);

    SelectionRequest category = CategoryRequest{"people"};
    back = JobSerializer::selectionFromJson(JobSerializer::selectionToJson(category));
    EXPECT_EQ(std::get<CategoryRequest>(back).category_id, "people");
}

TEST(JobSerializerTest, CategoryListing)
{
    json list = JobSerializer::categoriesToJson();
    ASSERT_EQ(list.size(), 6u);
    for (const auto &entry : list)
    {
        EXPECT_TRUE(entry.contains("id"));
        EXPECT_TRUE(entry.contains("name"));
        EXPECT_TRUE(entry.contains("description"));
        EXPECT_FALSE(entry.contains("prompts"));
    }
}

TEST(JobSerializerTest, TimestampsAreUtcSeconds)
{
    auto time = JobSerializer::parseTimestamp("2023-12-31T23:59:59Z");
    EXPECT_EQ(JobSerializer::formatTimestamp(time), "2023-12-31T23:59:59Z");
    EXPECT_EQ(JobSerializer::parseTimestamp("garbage"), std::chrono::system_clock::time_point{});
}
