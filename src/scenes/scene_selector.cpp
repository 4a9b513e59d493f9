#include "core/scenes/scene_selector.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <type_traits>

namespace
{
    // Minimum remaining budget worth a trimmed scene
    constexpr double kMinTrimmedSceneSeconds = 1.0;

    std::string formatSeconds(double seconds)
    {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f", seconds);
        return buffer;
    }
}

SelectionOptions SelectionOptions::fromSettings(const PipelineSettings &settings)
{
    SelectionOptions options;
    options.similarity_threshold = settings.similarity_threshold;
    options.target_duration_seconds = settings.target_duration_seconds;
    options.budget_policy = settings.budget_policy;
    return options;
}

BudgetedSceneSelector::BudgetedSceneSelector(const SelectionOptions &options) : options_(options) {}

std::vector<SceneCandidate> BudgetedSceneSelector::select(const SelectionInput &input) const
{
    std::vector<SceneCandidate> pool;
    for (const auto &candidate : input.candidates)
    {
        if (candidate.confidence >= options_.similarity_threshold && candidate.start < candidate.end)
            pool.push_back(candidate);
    }
    if (pool.empty())
    {
        throw NoMatchError("No scene reached the similarity threshold " +
                           formatSeconds(options_.similarity_threshold));
    }

    std::sort(pool.begin(), pool.end(), [](const SceneCandidate &a, const SceneCandidate &b)
              {
        if (a.confidence != b.confidence)
            return a.confidence > b.confidence;
        return a.start < b.start; });

    const double budget = options_.target_duration_seconds;
    std::vector<SceneCandidate> accepted;
    double total = 0.0;

    for (const auto &candidate : pool)
    {
        if (total >= budget)
            break;

        bool overlapping = std::any_of(accepted.begin(), accepted.end(), [&](const SceneCandidate &chosen)
                                       { return chosen.overlaps(candidate); });
        if (overlapping)
            continue;

        const double remaining = budget - total;
        if (candidate.duration() <= remaining)
        {
            accepted.push_back(candidate);
            total += candidate.duration();
            continue;
        }

        bool stop = false;
        switch (options_.budget_policy)
        {
        case BudgetPolicy::ADMIT_THEN_STOP:
            accepted.push_back(candidate);
            total += candidate.duration();
            stop = true;
            break;
        case BudgetPolicy::STRICT:
            break;
        case BudgetPolicy::TRIM_TO_FIT:
            if (remaining >= kMinTrimmedSceneSeconds)
            {
                SceneCandidate trimmed = candidate;
                trimmed.end = trimmed.start + remaining;
                accepted.push_back(trimmed);
                total += remaining;
            }
            stop = true;
            break;
        }
        if (stop)
            break;
    }

    if (accepted.empty())
    {
        throw NoMatchError("No matching scene fits the " + formatSeconds(budget) + "s target duration");
    }

    std::sort(accepted.begin(), accepted.end(), [](const SceneCandidate &a, const SceneCandidate &b)
              { return a.start < b.start; });

    Logger::debug("Selected " + std::to_string(accepted.size()) + " of " + std::to_string(pool.size()) +
                  " scenes, " + formatSeconds(total) + "s of " + formatSeconds(budget) + "s (" +
                  BudgetPolicies::getPolicyName(options_.budget_policy) + ")");
    return accepted;
}

TextPromptSelector::TextPromptSelector(const std::string &query, const SelectionOptions &options)
    : BudgetedSceneSelector(options), query_(query)
{
}

CategorySelector::CategorySelector(const std::string &category_id, const SelectionOptions &options)
    : BudgetedSceneSelector(options)
{
    const CategoryDefinition *definition = CategoryCatalog::find(category_id);
    if (!definition)
    {
        throw ValidationError("Unknown category: " + category_id);
    }
    category_ = *definition;
}

TimeRangeSelector::TimeRangeSelector(std::vector<PercentRange> ranges) : ranges_(std::move(ranges)) {}

std::string TimeRangeSelector::formatRangeLabel(double start_percent, double end_percent)
{
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%-%.1f%%", start_percent, end_percent);
    return buffer;
}

std::vector<SceneCandidate> TimeRangeSelector::select(const SelectionInput &input) const
{
    struct MappedRange
    {
        double start;
        double end;
        double start_percent;
        double end_percent;
    };

    const double duration = input.source_duration;
    if (duration <= 0.0)
    {
        throw ResourceError("Source duration unknown, cannot map time ranges");
    }
    if (ranges_.empty())
    {
        throw ValidationError("At least one time range is required");
    }

    std::vector<MappedRange> mapped;
    for (const auto &range : ranges_)
    {
        const double start = std::clamp(range.start_percent / 100.0 * duration, 0.0, duration);
        const double end = std::clamp(range.end_percent / 100.0 * duration, 0.0, duration);
        if (!(start < end))
        {
            throw ValidationError("Empty time range " + formatRangeLabel(range.start_percent, range.end_percent));
        }
        mapped.push_back(MappedRange{start, end, range.start_percent, range.end_percent});
    }

    std::sort(mapped.begin(), mapped.end(), [](const MappedRange &a, const MappedRange &b)
              { return a.start < b.start; });

    std::vector<MappedRange> merged;
    for (const auto &range : mapped)
    {
        if (!merged.empty() && range.start < merged.back().end)
        {
            MappedRange &previous = merged.back();
            if (range.end > previous.end)
            {
                previous.end = range.end;
                previous.end_percent = range.end_percent;
            }
        }
        else
        {
            merged.push_back(range);
        }
    }

    std::vector<SceneCandidate> scenes;
    for (const auto &range : merged)
    {
        SceneCandidate scene;
        scene.start = range.start;
        scene.end = range.end;
        scene.confidence = 1.0;
        scene.label = formatRangeLabel(range.start_percent, range.end_percent);
        scenes.push_back(scene);
    }

    if (merged.size() < mapped.size())
    {
        Logger::debug("Merged " + std::to_string(mapped.size()) + " overlapping time ranges into " +
                      std::to_string(merged.size()));
    }
    return scenes;
}

std::unique_ptr<SceneSelectionStrategy> SceneSelectorFactory::create(const SelectionRequest &request,
                                                                      const SelectionOptions &options)
{
    return std::visit([&options](const auto &selection) -> std::unique_ptr<SceneSelectionStrategy>
                      {
        using T = std::decay_t<decltype(selection)>;
        if constexpr (std::is_same_v<T, TextPromptRequest>)
            return std::make_unique<TextPromptSelector>(selection.query, options);
        else if constexpr (std::is_same_v<T, CategoryRequest>)
            return std::make_unique<CategorySelector>(selection.category_id, options);
        else
            return std::make_unique<TimeRangeSelector>(selection.ranges); },
                      request);
}
