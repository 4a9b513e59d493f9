#include "core/scenes/scene_aggregator.hpp"
#include "logging/logger.hpp"
#include <algorithm>

SceneAggregator::SceneAggregator(double threshold, double min_scene_seconds, double merge_gap_seconds)
    : threshold_(threshold), min_scene_seconds_(std::max(0.0, min_scene_seconds)),
      merge_gap_seconds_(std::max(0.0, merge_gap_seconds))
{
}

std::vector<SceneAggregator::Run> SceneAggregator::collectRuns(const std::vector<ScoredFrame> &scores, double step,
                                                               double duration) const
{
    std::vector<Run> runs;
    bool open = false;
    Run current{0.0, 0.0, 0.0, 0};
    double last_timestamp = 0.0;

    auto closeRun = [&]()
    {
        double end = last_timestamp + step;
        if (duration > 0.0)
            end = std::min(end, duration);
        if (end > current.start)
        {
            current.end = end;
            runs.push_back(current);
        }
        open = false;
    };

    for (const auto &frame : scores)
    {
        if (frame.score >= threshold_)
        {
            if (!open)
            {
                current = Run{frame.timestamp, frame.timestamp, 0.0, 0};
                open = true;
            }
            current.score_sum += frame.score;
            ++current.frames;
            last_timestamp = frame.timestamp;
        }
        else if (open)
        {
            closeRun();
        }
    }
    if (open)
    {
        closeRun();
    }
    return runs;
}

std::vector<SceneAggregator::Run> SceneAggregator::mergeRuns(const std::vector<Run> &runs) const
{
    std::vector<Run> merged;
    for (const auto &run : runs)
    {
        if (!merged.empty() && run.start - merged.back().end < merge_gap_seconds_)
        {
            Run &previous = merged.back();
            previous.end = std::max(previous.end, run.end);
            previous.score_sum += run.score_sum;
            previous.frames += run.frames;
        }
        else
        {
            merged.push_back(run);
        }
    }
    return merged;
}

std::vector<SceneCandidate> SceneAggregator::aggregate(std::vector<ScoredFrame> scores, double step, double duration,
                                                       const std::optional<std::string> &label) const
{
    std::stable_sort(scores.begin(), scores.end(), [](const ScoredFrame &a, const ScoredFrame &b)
                     { return a.timestamp < b.timestamp; });

    auto runs = mergeRuns(collectRuns(scores, std::max(0.0, step), duration));

    std::vector<SceneCandidate> scenes;
    size_t discarded = 0;
    for (const auto &run : runs)
    {
        if (run.end - run.start < min_scene_seconds_)
        {
            ++discarded;
            continue;
        }
        SceneCandidate scene;
        scene.start = run.start;
        scene.end = run.end;
        scene.confidence = std::clamp(run.score_sum / run.frames, 0.0, 1.0);
        scene.label = label;
        scenes.push_back(scene);
    }

    Logger::debug("Aggregated " + std::to_string(scores.size()) + " scored frames into " +
                  std::to_string(scenes.size()) + " scenes (" + std::to_string(discarded) + " too short)");
    return scenes;
}
