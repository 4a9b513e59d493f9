#include "core/job_serializer.hpp"
#include "core/category_catalog.hpp"
#include "core/summary_modes.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

json JobSerializer::jobToJson(const SummaryJob &job)
{
    json j;
    j["id"] = job.id;
    j["title"] = job.title;
    j["source"] = job.source_path;
    j["request"] = selectionToJson(job.selection);
    j["status"] = SummaryModes::getStatusName(job.status);
    j["progress_percent"] = job.progress_percent;

    json scenes = json::array();
    for (const auto &scene : job.selected_scenes)
        scenes.push_back(sceneToJson(scene));
    j["selected_scenes"] = scenes;
    j["summary_duration"] = job.totalSelectedDuration();

    j["artifact"] = job.artifact ? artifactToJson(*job.artifact) : json(nullptr);
    j["error_kind"] = job.error_kind ? json(*job.error_kind) : json(nullptr);
    j["error_message"] = job.error_message ? json(*job.error_message) : json(nullptr);
    j["created_at"] = formatTimestamp(job.created_at);
    j["updated_at"] = formatTimestamp(job.updated_at);
    return j;
}

json JobSerializer::progressToJson(const JobProgress &progress)
{
    json j;
    j["status"] = SummaryModes::getStatusName(progress.status);
    j["progress_percent"] = progress.progress_percent;
    if (progress.error_message)
        j["error_message"] = *progress.error_message;
    return j;
}

json JobSerializer::sceneToJson(const SceneCandidate &scene)
{
    json j;
    j["start"] = scene.start;
    j["end"] = scene.end;
    j["duration"] = scene.duration();
    j["confidence"] = scene.confidence;
    j["matched_label"] = scene.label ? json(*scene.label) : json(nullptr);
    return j;
}

json JobSerializer::artifactToJson(const ArtifactRef &artifact)
{
    json j;
    j["uri"] = artifact.uri;
    j["size_bytes"] = artifact.size_bytes;
    j["duration_seconds"] = artifact.duration_seconds;
    j["sha256"] = artifact.sha256;
    j["format"] = artifact.format;
    return j;
}

json JobSerializer::categoriesToJson()
{
    json list = json::array();
    for (const auto &category : CategoryCatalog::all())
    {
        list.push_back({{"id", category.id}, {"name", category.name}, {"description", category.description}});
    }
    return list;
}

json JobSerializer::selectionToJson(const SelectionRequest &selection)
{
    json j;
    j["mode"] = SummaryModes::getModeName(SummaryModes::modeOf(selection));
    if (auto text = std::get_if<TextPromptRequest>(&selection))
    {
        j["payload"] = {{"prompt", text->query}};
    }
    else if (auto category = std::get_if<CategoryRequest>(&selection))
    {
        j["payload"] = {{"category_id", category->category_id}};
    }
    else if (auto ranges = std::get_if<TimeRangeRequest>(&selection))
    {
        json list = json::array();
        for (const auto &range : ranges->ranges)
            list.push_back({{"start_percent", range.start_percent}, {"end_percent", range.end_percent}});
        j["payload"] = {{"ranges", list}};
    }
    return j;
}

SelectionRequest JobSerializer::selectionFromJson(const json &value)
{
    const std::string mode = value.at("mode").get<std::string>();
    const json &payload = value.at("payload");
    if (mode == "text-prompt")
        return TextPromptRequest{payload.at("prompt").get<std::string>()};
    if (mode == "category")
        return CategoryRequest{payload.at("category_id").get<std::string>()};

    TimeRangeRequest ranges;
    for (const auto &item : payload.at("ranges"))
    {
        ranges.ranges.push_back(PercentRange{item.at("start_percent").get<double>(),
                                             item.at("end_percent").get<double>()});
    }
    return ranges;
}

std::vector<SceneCandidate> JobSerializer::scenesFromJson(const json &value)
{
    std::vector<SceneCandidate> scenes;
    for (const auto &item : value)
    {
        SceneCandidate scene;
        scene.start = item.at("start").get<double>();
        scene.end = item.at("end").get<double>();
        scene.confidence = item.at("confidence").get<double>();
        if (item.contains("matched_label") && item["matched_label"].is_string())
            scene.label = item["matched_label"].get<std::string>();
        scenes.push_back(scene);
    }
    return scenes;
}

ArtifactRef JobSerializer::artifactFromJson(const json &value)
{
    ArtifactRef artifact;
    artifact.uri = value.at("uri").get<std::string>();
    artifact.size_bytes = value.at("size_bytes").get<std::uint64_t>();
    artifact.duration_seconds = value.at("duration_seconds").get<double>();
    artifact.sha256 = value.at("sha256").get<std::string>();
    artifact.format = value.value("format", "");
    return artifact;
}

std::string JobSerializer::formatTimestamp(std::chrono::system_clock::time_point time)
{
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::chrono::system_clock::time_point JobSerializer::parseTimestamp(const std::string &text)
{
    std::tm tm_utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail())
        return std::chrono::system_clock::time_point{};
    return std::chrono::system_clock::from_time_t(timegm(&tm_utc));
}
