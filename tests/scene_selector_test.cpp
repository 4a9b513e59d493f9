#include <gtest/gtest.h>
#include "core/error_types.hpp"
#include "core/scenes/scene_selector.hpp"
#include <algorithm>
#include <random>

namespace
{
    SceneCandidate scene(double start, double end, double confidence)
    {
        SceneCandidate candidate;
        candidate.start = start;
        candidate.end = end;
        candidate.confidence = confidence;
        candidate.label = std::string("query");
        return candidate;
    }

    SelectionOptions options(double threshold, double target, BudgetPolicy policy = BudgetPolicy::ADMIT_THEN_STOP)
    {
        SelectionOptions result;
        result.similarity_threshold = threshold;
        result.target_duration_seconds = target;
        result.budget_policy = policy;
        return result;
    }

    double totalDuration(const std::vector<SceneCandidate> &scenes)
    {
        double total = 0.0;
        for (const auto &s : scenes)
            total += s.duration();
        return total;
    }
}

TEST(SceneSelectorTest, OnlyScenesAboveThresholdAreSelected)
{
    TextPromptSelector selector("sunset", options(0.5, 60.0));
    SelectionInput input;
    input.source_duration = 120.0;
    input.candidates = {scene(40.0, 45.0, 0.4), scene(10.0, 20.0, 0.9)};

    auto selected = selector.select(input);
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_DOUBLE_EQ(selected[0].start, 10.0);
    EXPECT_DOUBLE_EQ(selected[0].end, 20.0);
    EXPECT_DOUBLE_EQ(selected[0].confidence, 0.9);
}

TEST(SceneSelectorTest, NothingAboveThresholdIsNoMatch)
{
    TextPromptSelector selector("sunset", options(0.5, 60.0));
    SelectionInput input;
    input.source_duration = 60.0;
    input.candidates = {scene(0.0, 5.0, 0.3)};
    EXPECT_THROW(selector.select(input), NoMatchError);

    input.candidates.clear();
    EXPECT_THROW(selector.select(input), NoMatchError);
}

TEST(SceneSelectorTest, HighestConfidenceFirstThenSortedByStart)
{
    TextPromptSelector selector("q", options(0.2, 15.0, BudgetPolicy::STRICT));
    SelectionInput input;
    input.source_duration = 100.0;
    input.candidates = {scene(0.0, 10.0, 0.3), scene(50.0, 60.0, 0.8), scene(20.0, 25.0, 0.6)};

    auto selected = selector.select(input);
    // 0.8 (10 s) then 0.6 (5 s) fill the 15 s budget; 0.3 is left out
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_DOUBLE_EQ(selected[0].start, 20.0);
    EXPECT_DOUBLE_EQ(selected[1].start, 50.0);
    EXPECT_DOUBLE_EQ(totalDuration(selected), 15.0);
}

TEST(SceneSelectorTest, AdmitThenStopTakesOneOversizedScene)
{
    TextPromptSelector selector("q", options(0.5, 12.0, BudgetPolicy::ADMIT_THEN_STOP));
    SelectionInput input;
    input.source_duration = 100.0;
    input.candidates = {scene(0.0, 10.0, 0.9), scene(20.0, 30.0, 0.8), scene(40.0, 42.0, 0.7)};

    auto selected = selector.select(input);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_DOUBLE_EQ(selected[0].start, 0.0);
    EXPECT_DOUBLE_EQ(selected[1].start, 20.0);
    // Budget plus at most one scene
    EXPECT_LE(totalDuration(selected), 12.0 + 10.0);
}

TEST(SceneSelectorTest, StrictSkipsScenesThatDoNotFit)
{
    TextPromptSelector selector("q", options(0.5, 12.0, BudgetPolicy::STRICT));
    SelectionInput input;
    input.source_duration = 100.0;
    input.candidates = {scene(0.0, 10.0, 0.9), scene(20.0, 30.0, 0.8), scene(40.0, 42.0, 0.7)};

    auto selected = selector.select(input);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_DOUBLE_EQ(selected[0].start, 0.0);
    EXPECT_DOUBLE_EQ(selected[1].start, 40.0);
    EXPECT_DOUBLE_EQ(totalDuration(selected), 12.0);
}

TEST(SceneSelectorTest, StrictWithNothingFittingIsNoMatch)
{
    TextPromptSelector selector("q", options(0.5, 3.0, BudgetPolicy::STRICT));
    SelectionInput input;
    input.source_duration = 100.0;
    input.candidates = {scene(0.0, 10.0, 0.9)};
    EXPECT_THROW(selector.select(input), NoMatchError);
}

TEST(SceneSelectorTest, TrimToFitCutsTheLastScene)
{
    TextPromptSelector selector("q", options(0.5, 12.0, BudgetPolicy::TRIM_TO_FIT));
    SelectionInput input;
    input.source_duration = 100.0;
    input.candidates = {scene(0.0, 10.0, 0.9), scene(20.0, 30.0, 0.8)};

    auto selected = selector.select(input);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_DOUBLE_EQ(selected[1].start, 20.0);
    EXPECT_DOUBLE_EQ(selected[1].end, 22.0);
    EXPECT_DOUBLE_EQ(totalDuration(selected), 12.0);
}

TEST(SceneSelectorTest, TrimToFitDropsSlivers)
{
    TextPromptSelector selector("q", options(0.5, 10.5, BudgetPolicy::TRIM_TO_FIT));
    SelectionInput input;
    input.source_duration = 100.0;
    input.candidates = {scene(0.0, 10.0, 0.9), scene(20.0, 30.0, 0.8)};

    auto selected = selector.select(input);
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_DOUBLE_EQ(selected[0].end, 10.0);
}

TEST(SceneSelectorTest, OverlappingCandidatesAreSkipped)
{
    TextPromptSelector selector("q", options(0.5, 60.0));
    SelectionInput input;
    input.source_duration = 100.0;
    input.candidates = {scene(0.0, 10.0, 0.9), scene(5.0, 15.0, 0.8), scene(20.0, 25.0, 0.6)};

    auto selected = selector.select(input);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_DOUBLE_EQ(selected[0].start, 0.0);
    EXPECT_DOUBLE_EQ(selected[1].start, 20.0);
}

TEST(SceneSelectorTest, SelectionIsOrderedDisjointAndWithinBudget)
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> start_dist(0.0, 290.0);
    std::uniform_real_distribution<double> length_dist(0.5, 10.0);
    std::uniform_real_distribution<double> confidence_dist(0.0, 1.0);

    for (int round = 0; round < 50; ++round)
    {
        SelectionInput input;
        input.source_duration = 300.0;
        double longest = 0.0;
        for (int i = 0; i < 40; ++i)
        {
            const double start = start_dist(rng);
            const double length = length_dist(rng);
            longest = std::max(longest, length);
            input.candidates.push_back(scene(start, start + length, confidence_dist(rng)));
        }

        TextPromptSelector selector("q", options(0.3, 30.0));
        std::vector<SceneCandidate> selected;
        try
        {
            selected = selector.select(input);
        }
        catch (const NoMatchError &)
        {
            continue;
        }

        EXPECT_LE(totalDuration(selected), 30.0 + longest);
        for (size_t i = 0; i < selected.size(); ++i)
        {
            EXPECT_GE(selected[i].confidence, 0.3);
            if (i > 0)
            {
                EXPECT_LE(selected[i - 1].start, selected[i].start);
                EXPECT_FALSE(selected[i - 1].overlaps(selected[i]));
            }
        }
    }
}

TEST(SceneSelectorTest, CategorySelectorUsesCatalogPrompts)
{
    CategorySelector selector("landscape", options(0.5, 60.0));
    EXPECT_EQ(selector.label(), "landscape");
    EXPECT_TRUE(selector.usesEmbeddings());
    EXPECT_EQ(selector.prompts(), CategoryCatalog::find("landscape")->prompts);
}

TEST(SceneSelectorTest, UnknownCategoryIsRejected)
{
    EXPECT_THROW({ CategorySelector selector("cooking", options(0.5, 60.0)); }, ValidationError);
}

TEST(TimeRangeSelectorTest, MapsPercentagesOntoDuration)
{
    TimeRangeSelector selector({{0.0, 25.0}, {50.0, 75.0}});
    SelectionInput input;
    input.source_duration = 100.0;

    auto scenes = selector.select(input);
    ASSERT_EQ(scenes.size(), 2u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 0.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 25.0);
    EXPECT_DOUBLE_EQ(scenes[1].start, 50.0);
    EXPECT_DOUBLE_EQ(scenes[1].end, 75.0);
    EXPECT_DOUBLE_EQ(scenes[0].confidence, 1.0);
    ASSERT_TRUE(scenes[0].label.has_value());
    EXPECT_EQ(*scenes[0].label, "0.0%-25.0%");
    EXPECT_FALSE(selector.usesEmbeddings());
    EXPECT_TRUE(selector.prompts().empty());
}

TEST(TimeRangeSelectorTest, OverlappingRangesMerge)
{
    TimeRangeSelector selector({{40.0, 60.0}, {10.0, 20.0}, {15.0, 30.0}});
    SelectionInput input;
    input.source_duration = 200.0;

    auto scenes = selector.select(input);
    ASSERT_EQ(scenes.size(), 2u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 20.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 60.0);
    EXPECT_EQ(*scenes[0].label, "10.0%-30.0%");
    EXPECT_DOUBLE_EQ(scenes[1].start, 80.0);
    EXPECT_DOUBLE_EQ(scenes[1].end, 120.0);
}

TEST(TimeRangeSelectorTest, TouchingRangesStaySeparate)
{
    TimeRangeSelector selector({{0.0, 50.0}, {50.0, 100.0}});
    SelectionInput input;
    input.source_duration = 10.0;
    EXPECT_EQ(selector.select(input).size(), 2u);
}

TEST(TimeRangeSelectorTest, RangesAreClampedToTheSource)
{
    TimeRangeSelector selector({{90.0, 150.0}});
    SelectionInput input;
    input.source_duration = 10.0;

    auto scenes = selector.select(input);
    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 9.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 10.0);
}

TEST(TimeRangeSelectorTest, EmptyRangesAreRejected)
{
    SelectionInput input;
    input.source_duration = 10.0;

    EXPECT_THROW(TimeRangeSelector({{30.0, 30.0}}).select(input), ValidationError);
    EXPECT_THROW(TimeRangeSelector({{120.0, 150.0}}).select(input), ValidationError);
    EXPECT_THROW(TimeRangeSelector({}).select(input), ValidationError);
}

TEST(TimeRangeSelectorTest, UnknownDurationIsAResourceError)
{
    TimeRangeSelector selector({{0.0, 50.0}});
    SelectionInput input;
    EXPECT_THROW(selector.select(input), ResourceError);
}

TEST(SceneSelectorFactoryTest, CreatesOneStrategyPerRequestKind)
{
    const SelectionOptions opts = options(0.25, 60.0);

    auto text = SceneSelectorFactory::create(SelectionRequest{TextPromptRequest{"a dog"}}, opts);
    EXPECT_NE(dynamic_cast<TextPromptSelector *>(text.get()), nullptr);
    EXPECT_EQ(text->prompts(), std::vector<std::string>{"a dog"});
    EXPECT_EQ(text->label(), "a dog");

    auto category = SceneSelectorFactory::create(SelectionRequest{CategoryRequest{"action"}}, opts);
    EXPECT_NE(dynamic_cast<CategorySelector *>(category.get()), nullptr);

    auto ranges = SceneSelectorFactory::create(SelectionRequest{TimeRangeRequest{{{0.0, 10.0}}}}, opts);
    EXPECT_NE(dynamic_cast<TimeRangeSelector *>(ranges.get()), nullptr);
    EXPECT_EQ(ranges->label(), "time-range");
}
