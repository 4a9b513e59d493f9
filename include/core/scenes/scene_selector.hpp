#pragma once

#include "core/category_catalog.hpp"
#include "core/pipeline_settings.hpp"
#include "core/summary_types.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief What a selection strategy works from
 */
struct SelectionInput
{
    std::vector<SceneCandidate> candidates; // unused by time-range selection
    double source_duration = 0.0;
};

struct SelectionOptions
{
    double similarity_threshold = 0.25;
    double target_duration_seconds = 60.0;
    BudgetPolicy budget_policy = BudgetPolicy::ADMIT_THEN_STOP;

    static SelectionOptions fromSettings(const PipelineSettings &settings);
};

/**
 * @brief Picks the final scenes of a summary
 *
 * Every implementation returns scenes sorted by start with no two overlapping.
 */
class SceneSelectionStrategy
{
public:
    virtual ~SceneSelectionStrategy() = default;

    virtual std::vector<SceneCandidate> select(const SelectionInput &input) const = 0;

    // False when scenes come straight from the request and no frame is embedded
    virtual bool usesEmbeddings() const = 0;

    // Text prompts to match frames against; empty when usesEmbeddings() is false
    virtual std::vector<std::string> prompts() const = 0;

    // Label attached to matched scenes
    virtual std::string label() const = 0;
};

/**
 * @brief Greedy highest-confidence-first selection under a duration budget
 */
class BudgetedSceneSelector : public SceneSelectionStrategy
{
public:
    explicit BudgetedSceneSelector(const SelectionOptions &options);

    /**
     * @throws NoMatchError when no candidate clears the threshold or none fits the budget
     */
    std::vector<SceneCandidate> select(const SelectionInput &input) const override;

    bool usesEmbeddings() const override { return true; }

protected:
    SelectionOptions options_;
};

class TextPromptSelector : public BudgetedSceneSelector
{
public:
    TextPromptSelector(const std::string &query, const SelectionOptions &options);

    std::vector<std::string> prompts() const override { return {query_}; }
    std::string label() const override { return query_; }

private:
    std::string query_;
};

class CategorySelector : public BudgetedSceneSelector
{
public:
    /**
     * @throws ValidationError for an id outside the catalog
     */
    CategorySelector(const std::string &category_id, const SelectionOptions &options);

    std::vector<std::string> prompts() const override { return category_.prompts; }
    std::string label() const override { return category_.id; }

private:
    CategoryDefinition category_;
};

/**
 * @brief Maps percentage ranges onto the source timeline
 */
class TimeRangeSelector : public SceneSelectionStrategy
{
public:
    explicit TimeRangeSelector(std::vector<PercentRange> ranges);

    /**
     * @throws ValidationError when a range is empty after clamping
     */
    std::vector<SceneCandidate> select(const SelectionInput &input) const override;

    bool usesEmbeddings() const override { return false; }
    std::vector<std::string> prompts() const override { return {}; }
    std::string label() const override { return "time-range"; }

    static std::string formatRangeLabel(double start_percent, double end_percent);

private:
    std::vector<PercentRange> ranges_;
};

class SceneSelectorFactory
{
public:
    static std::unique_ptr<SceneSelectionStrategy> create(const SelectionRequest &request,
                                                          const SelectionOptions &options);
};
