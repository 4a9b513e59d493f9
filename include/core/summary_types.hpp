#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief Immutable description of a decodable source video
 */
struct SourceVideo
{
    std::string path;
    double duration_seconds = 0.0;
    double frame_rate = 0.0;
    int width = 0;
    int height = 0;
    std::string container_format;
    std::string video_codec;
    bool has_audio = false;
};

/**
 * @brief A sampled frame's position in time and its embedding
 */
struct FrameSample
{
    double timestamp = 0.0;
    std::vector<float> embedding;
};

struct ScoredFrame
{
    double timestamp = 0.0;
    double score = 0.0;
};

struct SceneCandidate
{
    double start = 0.0;
    double end = 0.0;
    double confidence = 0.0;
    std::optional<std::string> label;

    double duration() const { return end - start; }

    bool overlaps(const SceneCandidate &other) const
    {
        return start < other.end && other.start < end;
    }

    bool operator==(const SceneCandidate &other) const
    {
        return start == other.start && end == other.end && confidence == other.confidence &&
               label == other.label;
    }
};

enum class SelectionMode
{
    TEXT_PROMPT,
    CATEGORY,
    TIME_RANGE
};

struct TextPromptRequest
{
    std::string query;
};

struct CategoryRequest
{
    std::string category_id;
};

struct PercentRange
{
    double start_percent = 0.0;
    double end_percent = 0.0;
};

struct TimeRangeRequest
{
    std::vector<PercentRange> ranges;
};

using SelectionRequest = std::variant<TextPromptRequest, CategoryRequest, TimeRangeRequest>;

/**
 * @brief Validated input of a summarization job
 */
struct CreateJobRequest
{
    std::string title;
    std::string source_path;
    SelectionRequest selection;
};

enum class JobStatus
{
    QUEUED,
    PROCESSING,
    COMPLETED,
    FAILED,
    CANCELLED
};

/**
 * @brief Handle of a stored summary video
 */
struct ArtifactRef
{
    std::string uri;
    std::uint64_t size_bytes = 0;
    double duration_seconds = 0.0;
    std::string sha256;
    std::string format;
};

struct JobProgress
{
    JobStatus status = JobStatus::QUEUED;
    int progress_percent = 0;
    std::optional<std::string> error_message;
};

/**
 * @brief Complete record of one summarization job
 *
 * Created on submission, mutated only through the job store,
 * terminal once completed, failed or cancelled.
 */
struct SummaryJob
{
    std::string id;
    std::string title;
    std::string source_path;
    SelectionRequest selection;
    JobStatus status = JobStatus::QUEUED;
    int progress_percent = 0;
    std::vector<SceneCandidate> selected_scenes;
    std::optional<ArtifactRef> artifact;
    std::optional<std::string> error_kind;
    std::optional<std::string> error_message;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    double totalSelectedDuration() const
    {
        double total = 0.0;
        for (const auto &scene : selected_scenes)
            total += scene.duration();
        return total;
    }
};
