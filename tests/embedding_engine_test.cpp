#include <gtest/gtest.h>
#include "fake_embedding_model.hpp"
#include "core/embedding/embedding_engine.hpp"
#include "core/embedding/embedding_model_provider.hpp"
#include "core/error_types.hpp"
#include <cmath>
#include <stdexcept>

namespace
{
    DecodedFrame solidFrame(double timestamp, const cv::Scalar &rgb)
    {
        DecodedFrame frame;
        frame.timestamp = timestamp;
        frame.image = cv::Mat(8, 8, CV_8UC3, rgb);
        return frame;
    }

    double norm(const std::vector<float> &v)
    {
        double sum = 0.0;
        for (float x : v)
            sum += static_cast<double>(x) * x;
        return std::sqrt(sum);
    }
}

class EmbeddingEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        model_ = std::make_shared<FakeEmbeddingModel>(std::map<std::string, std::vector<float>>{
            {"red", {1.0f, 0.0f, 0.0f}}, {"green", {0.0f, 2.0f, 0.0f}}, {"blue", {0.0f, 0.0f, 3.0f}}});
    }

    std::shared_ptr<FakeEmbeddingModel> model_;
};

TEST_F(EmbeddingEngineTest, CosineProperties)
{
    EXPECT_DOUBLE_EQ(EmbeddingEngine::rawCosine({1, 0}, {1, 0}), 1.0);
    EXPECT_NEAR(EmbeddingEngine::rawCosine({1, 0}, {0, 1}), 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(EmbeddingEngine::rawCosine({1, 0}, {-1, 0}), -1.0);
    EXPECT_DOUBLE_EQ(EmbeddingEngine::similarity({1, 0}, {-1, 0}), 0.0);
    EXPECT_DOUBLE_EQ(EmbeddingEngine::rawCosine({0, 0}, {1, 0}), 0.0);
    EXPECT_THROW(EmbeddingEngine::rawCosine({1, 0}, {1, 0, 0}), SummarizerError);
}

TEST_F(EmbeddingEngineTest, NormalizeLeavesZeroVectorAlone)
{
    std::vector<float> v = {3.0f, 4.0f};
    EmbeddingEngine::normalize(v);
    EXPECT_NEAR(v[0], 0.6f, 1e-6);
    EXPECT_NEAR(v[1], 0.8f, 1e-6);

    std::vector<float> zero = {0.0f, 0.0f};
    EmbeddingEngine::normalize(zero);
    EXPECT_EQ(zero, (std::vector<float>{0.0f, 0.0f}));
}

TEST_F(EmbeddingEngineTest, EmbedsFramesInBatches)
{
    EmbeddingEngine engine(model_, 4);
    std::vector<DecodedFrame> frames;
    for (int i = 0; i < 10; ++i)
        frames.push_back(solidFrame(i * 0.5, cv::Scalar(200, 0, 0)));

    auto samples = engine.embedFrames(frames);
    ASSERT_EQ(samples.size(), 10u);
    EXPECT_EQ(model_->imageBatches(), 3u);
    for (size_t i = 0; i < samples.size(); ++i)
    {
        EXPECT_DOUBLE_EQ(samples[i].timestamp, i * 0.5);
        EXPECT_NEAR(norm(samples[i].embedding), 1.0, 1e-6);
    }
}

TEST_F(EmbeddingEngineTest, ScoresFollowColors)
{
    EmbeddingEngine engine(model_);
    auto samples = engine.embedFrames({solidFrame(0.0, cv::Scalar(255, 0, 0)), solidFrame(1.0, cv::Scalar(0, 255, 0)),
                                       solidFrame(2.0, cv::Scalar(230, 111, 0))});
    auto scores = engine.scoreFrames(samples, engine.embedText("red"));

    ASSERT_EQ(scores.size(), 3u);
    EXPECT_NEAR(scores[0].score, 1.0, 1e-6);
    EXPECT_NEAR(scores[1].score, 0.0, 1e-6);
    EXPECT_NEAR(scores[2].score, 0.9, 0.01);
    for (const auto &score : scores)
    {
        EXPECT_GE(score.score, 0.0);
        EXPECT_LE(score.score, 1.0);
    }
}

TEST_F(EmbeddingEngineTest, PromptEnsembleIsNormalizedMean)
{
    EmbeddingEngine engine(model_);
    // Unequal raw lengths count equally once normalized
    auto ensemble = engine.embedPrompts({"green", "blue"});
    ASSERT_EQ(ensemble.size(), 3u);
    EXPECT_NEAR(ensemble[0], 0.0f, 1e-6);
    EXPECT_NEAR(ensemble[1], std::sqrt(0.5f), 1e-6);
    EXPECT_NEAR(ensemble[2], std::sqrt(0.5f), 1e-6);

    EXPECT_THROW(engine.embedPrompts({}), ValidationError);
}

TEST_F(EmbeddingEngineTest, RequiresModel)
{
    EXPECT_THROW({ EmbeddingEngine engine(nullptr); }, ResourceError);
}

TEST(EmbeddingModelProviderTest, LoadsOnceAndShares)
{
    int loads = 0;
    EmbeddingModelProvider provider([&loads]() -> std::shared_ptr<const EmbeddingModel>
                                    {
        ++loads;
        return std::make_shared<FakeEmbeddingModel>(); });

    EXPECT_FALSE(provider.isLoaded());
    auto first = provider.get();
    auto second = provider.get();
    EXPECT_EQ(first, second);
    EXPECT_EQ(loads, 1);
    EXPECT_TRUE(provider.isLoaded());
}

TEST(EmbeddingModelProviderTest, FailedLoadIsRetried)
{
    int attempts = 0;
    EmbeddingModelProvider provider([&attempts]() -> std::shared_ptr<const EmbeddingModel>
                                    {
        if (++attempts == 1)
            throw std::runtime_error("model file busy");
        return std::make_shared<FakeEmbeddingModel>(); });

    EXPECT_THROW(provider.get(), ResourceError);
    EXPECT_FALSE(provider.isLoaded());
    EXPECT_NE(provider.get(), nullptr);
    EXPECT_EQ(attempts, 2);
}

TEST(EmbeddingModelProviderTest, MissingClipFilesAreResourceErrors)
{
    PipelineSettings settings;
    settings.visual_model_path = "/nonexistent/visual.onnx";
    settings.text_model_path = "/nonexistent/text.onnx";
    settings.tokenizer_path = "/nonexistent/tokenizer.json";

    auto provider = EmbeddingModelProvider::forClip(settings);
    EXPECT_THROW(provider->get(), ResourceError);
    EXPECT_FALSE(provider->isLoaded());
}
