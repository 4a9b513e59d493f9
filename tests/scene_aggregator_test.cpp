#include <gtest/gtest.h>
#include "core/scenes/scene_aggregator.hpp"
#include <vector>

namespace
{
    // One score per step seconds starting at 0
    std::vector<ScoredFrame> scoresEvery(double step, const std::vector<double> &values)
    {
        std::vector<ScoredFrame> scores;
        for (size_t i = 0; i < values.size(); ++i)
            scores.push_back(ScoredFrame{i * step, values[i]});
        return scores;
    }
}

TEST(SceneAggregatorTest, RunAboveThresholdBecomesScene)
{
    SceneAggregator aggregator(0.5, 1.0, 0.0);
    // Frames at 2..5 s match; the run ends one step after its last frame
    auto scenes = aggregator.aggregate(scoresEvery(1.0, {0.1, 0.2, 0.8, 0.9, 0.7, 0.6, 0.1, 0.0}), 1.0, 8.0,
                                       std::string("sunset"));

    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 2.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 6.0);
    EXPECT_NEAR(scenes[0].confidence, 0.75, 1e-9);
    ASSERT_TRUE(scenes[0].label.has_value());
    EXPECT_EQ(*scenes[0].label, "sunset");
}

TEST(SceneAggregatorTest, ThresholdIsInclusive)
{
    SceneAggregator aggregator(0.5, 0.0, 0.0);
    auto scenes = aggregator.aggregate(scoresEvery(1.0, {0.5, 0.49}), 1.0, 2.0);
    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 0.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 1.0);
    EXPECT_FALSE(scenes[0].label.has_value());
}

TEST(SceneAggregatorTest, SmallGapsMerge)
{
    SceneAggregator aggregator(0.5, 0.0, 2.0);
    // Runs [0,2) and [3,5): gap of 1 s merges, the run at 9 s stays apart
    auto scenes = aggregator.aggregate(scoresEvery(1.0, {0.8, 0.8, 0.0, 0.6, 0.6, 0.0, 0.0, 0.0, 0.0, 0.9}), 1.0,
                                       10.0);

    ASSERT_EQ(scenes.size(), 2u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 0.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 5.0);
    EXPECT_NEAR(scenes[0].confidence, 0.7, 1e-9);
    EXPECT_DOUBLE_EQ(scenes[1].start, 9.0);
    EXPECT_DOUBLE_EQ(scenes[1].end, 10.0);
}

TEST(SceneAggregatorTest, ShortScenesAreDropped)
{
    SceneAggregator aggregator(0.5, 2.0, 0.0);
    auto scenes = aggregator.aggregate(scoresEvery(1.0, {0.9, 0.0, 0.9, 0.9, 0.9, 0.0}), 1.0, 6.0);
    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 2.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 5.0);
}

TEST(SceneAggregatorTest, SceneEndIsClampedToDuration)
{
    SceneAggregator aggregator(0.5, 0.0, 0.0);
    auto scenes = aggregator.aggregate(scoresEvery(2.0, {0.1, 0.9, 0.9}), 2.0, 5.0);
    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 2.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 5.0);
}

TEST(SceneAggregatorTest, UnsortedInputIsOrdered)
{
    SceneAggregator aggregator(0.5, 0.0, 0.0);
    std::vector<ScoredFrame> scores = {{3.0, 0.9}, {0.0, 0.9}, {2.0, 0.1}, {1.0, 0.9}};
    auto scenes = aggregator.aggregate(scores, 1.0, 4.0);

    ASSERT_EQ(scenes.size(), 2u);
    EXPECT_DOUBLE_EQ(scenes[0].start, 0.0);
    EXPECT_DOUBLE_EQ(scenes[0].end, 2.0);
    EXPECT_DOUBLE_EQ(scenes[1].start, 3.0);
    EXPECT_DOUBLE_EQ(scenes[1].end, 4.0);
}

TEST(SceneAggregatorTest, NothingAboveThreshold)
{
    SceneAggregator aggregator(0.5, 1.0, 2.0);
    EXPECT_TRUE(aggregator.aggregate(scoresEvery(1.0, {0.1, 0.2, 0.3}), 1.0, 3.0).empty());
    EXPECT_TRUE(aggregator.aggregate({}, 1.0, 3.0).empty());
}

TEST(SceneAggregatorTest, ScenesAreSortedAndDisjoint)
{
    SceneAggregator aggregator(0.4, 0.5, 1.0);
    std::vector<double> values;
    for (int i = 0; i < 200; ++i)
        values.push_back(((i * 7919) % 100) / 100.0);

    auto scenes = aggregator.aggregate(scoresEvery(0.5, values), 0.5, 100.0);
    for (size_t i = 0; i < scenes.size(); ++i)
    {
        EXPECT_LT(scenes[i].start, scenes[i].end);
        EXPECT_GE(scenes[i].confidence, 0.4);
        EXPECT_LE(scenes[i].confidence, 1.0);
        if (i > 0)
            EXPECT_LE(scenes[i - 1].end, scenes[i].start);
    }
}
