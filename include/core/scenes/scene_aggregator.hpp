#pragma once

#include "core/summary_types.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Turns per-frame similarity scores into candidate scenes
 *
 * A frame covers the time from its timestamp to the next sample, so a run of
 * matching frames ending at t ends at min(t + step, duration).
 */
class SceneAggregator
{
public:
    SceneAggregator(double threshold, double min_scene_seconds, double merge_gap_seconds);

    /**
     * @brief Group frames scoring at least the threshold into scenes
     * @param scores Scored frames; sorted by timestamp here if they are not already
     * @param step Sampling step in seconds
     * @param duration Source duration, upper bound for every scene end
     * @param label Matched label attached to every scene
     * @return Scenes sorted by start, none shorter than the minimum scene length
     */
    std::vector<SceneCandidate> aggregate(std::vector<ScoredFrame> scores, double step, double duration,
                                          const std::optional<std::string> &label = std::nullopt) const;

    double threshold() const { return threshold_; }

private:
    struct Run
    {
        double start;
        double end;
        double score_sum;
        int frames;
    };

    std::vector<Run> collectRuns(const std::vector<ScoredFrame> &scores, double step, double duration) const;
    std::vector<Run> mergeRuns(const std::vector<Run> &runs) const;

    double threshold_;
    double min_scene_seconds_;
    double merge_gap_seconds_;
};
