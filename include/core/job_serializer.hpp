#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "core/summary_types.hpp"

/**
 * @brief JSON shapes of job records, progress snapshots and the category listing
 */
class JobSerializer
{
public:
    static nlohmann::json jobToJson(const SummaryJob &job);
    static nlohmann::json progressToJson(const JobProgress &progress);
    static nlohmann::json sceneToJson(const SceneCandidate &scene);
    static nlohmann::json artifactToJson(const ArtifactRef &artifact);
    static nlohmann::json categoriesToJson();

    /**
     * @brief `{mode, payload}` form of a selection, as in a create request
     */
    static nlohmann::json selectionToJson(const SelectionRequest &selection);
    static SelectionRequest selectionFromJson(const nlohmann::json &value);

    static std::vector<SceneCandidate> scenesFromJson(const nlohmann::json &value);
    static ArtifactRef artifactFromJson(const nlohmann::json &value);

    // ISO 8601 UTC, second precision
    static std::string formatTimestamp(std::chrono::system_clock::time_point time);
    static std::chrono::system_clock::time_point parseTimestamp(const std::string &text);
};
