#pragma once

#include <cstddef>
#include <string>

/**
 * @brief What budgeted selection does with the candidate that crosses the target duration
 */
enum class BudgetPolicy
{
    ADMIT_THEN_STOP, // admit it while the budget is not yet reached, then stop
    STRICT,          // skip it and keep looking for candidates that still fit
    TRIM_TO_FIT      // shorten it to the remaining budget, then stop
};

/**
 * @brief Snapshot of every tunable the pipeline reads, taken from ConfigManager
 */
struct PipelineSettings
{
    // threading
    int max_workers = 2;

    // sampling
    int stride_frames = 30;
    double stride_seconds = 0.0;
    int max_frame_side = 448;

    // embedding
    std::string visual_model_path = "models/clip_visual.onnx";
    std::string text_model_path = "models/clip_text.onnx";
    std::string tokenizer_path = "models/tokenizer.json";
    int embedding_batch_size = 16;
    int intra_op_threads = 2;

    // scenes
    double similarity_threshold = 0.25;
    double min_scene_seconds = 1.0;
    double merge_gap_seconds = 2.0;

    // selection
    double target_duration_seconds = 60.0;
    BudgetPolicy budget_policy = BudgetPolicy::ADMIT_THEN_STOP;

    // composer
    std::string output_format = "mp4";
    bool prefer_stream_copy = true;
    int max_retries = 3;
    int retry_backoff_ms = 100;

    // storage
    std::string scratch_dir = "scratch";
    std::string artifact_dir = "summaries";
    std::string database_path;

    // request validation
    std::size_t max_prompt_length = 500;
    std::size_t max_title_length = 200;
    std::size_t max_ranges = 64;
};

class BudgetPolicies
{
public:
    static std::string getPolicyName(BudgetPolicy policy)
    {
        switch (policy)
        {
        case BudgetPolicy::ADMIT_THEN_STOP:
            return "admit_then_stop";
        case BudgetPolicy::STRICT:
            return "strict";
        case BudgetPolicy::TRIM_TO_FIT:
            return "trim_to_fit";
        }
        return "admit_then_stop";
    }

    static bool fromString(const std::string &name, BudgetPolicy &policy)
    {
        if (name == "admit_then_stop")
            policy = BudgetPolicy::ADMIT_THEN_STOP;
        else if (name == "strict")
            policy = BudgetPolicy::STRICT;
        else if (name == "trim_to_fit")
            policy = BudgetPolicy::TRIM_TO_FIT;
        else
            return false;
        return true;
    }
};
