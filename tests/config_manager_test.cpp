#include "test_base.hpp"
#include "core/config_manager.hpp"
#include "core/logger_observer.hpp"
#include <fstream>
#include <memory>
#include <vector>

class RecordingObserver : public ConfigObserver
{
public:
    void onConfigChanged(const ConfigEvent &event) override { events.push_back(event); }

    std::vector<ConfigEvent> events;
};

class ConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        ConfigManager::getInstance().resetForTesting();
    }

    void TearDown() override
    {
        ConfigManager::getInstance().resetForTesting();
        Logger::setLevel("INFO");
        TestBase::TearDown();
    }
};

TEST_F(ConfigManagerTest, DefaultsMatchPipelineSettings)
{
    PipelineSettings defaults;
    PipelineSettings settings = ConfigManager::getInstance().pipelineSettings();

    EXPECT_EQ(settings.max_workers, defaults.max_workers);
    EXPECT_EQ(settings.stride_frames, defaults.stride_frames);
    EXPECT_DOUBLE_EQ(settings.similarity_threshold, defaults.similarity_threshold);
    EXPECT_DOUBLE_EQ(settings.min_scene_seconds, defaults.min_scene_seconds);
    EXPECT_DOUBLE_EQ(settings.merge_gap_seconds, defaults.merge_gap_seconds);
    EXPECT_DOUBLE_EQ(settings.target_duration_seconds, defaults.target_duration_seconds);
    EXPECT_EQ(settings.budget_policy, BudgetPolicy::ADMIT_THEN_STOP);
    EXPECT_EQ(settings.output_format, "mp4");
    EXPECT_TRUE(settings.prefer_stream_copy);
    EXPECT_EQ(settings.max_prompt_length, 500u);
    EXPECT_EQ(ConfigManager::getInstance().getLogLevel(), "INFO");
}

TEST_F(ConfigManagerTest, LoadOrCreateWritesDefaultFile)
{
    const std::string path = testPath("config.yaml");
    ASSERT_FALSE(std::filesystem::exists(path));

    ASSERT_TRUE(ConfigManager::getInstance().loadOrCreate(path));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(ConfigManager::getInstance().getConfigPath(), path);

    YAML::Node written = YAML::LoadFile(path);
    EXPECT_EQ(written["scenes"]["similarity_threshold"].as<double>(), 0.25);
    EXPECT_EQ(written["selection"]["budget_policy"].as<std::string>(), "admit_then_stop");
}

TEST_F(ConfigManagerTest, PartialFileKeepsOtherDefaults)
{
    writeFile("partial.yaml", "log_level: DEBUG\n"
                              "scenes:\n"
                              "  similarity_threshold: 0.4\n"
                              "selection:\n"
                              "  budget_policy: strict\n"
                              "  target_duration_seconds: 30\n");

    ASSERT_TRUE(ConfigManager::getInstance().loadConfig(testPath("partial.yaml")));
    PipelineSettings settings = ConfigManager::getInstance().pipelineSettings();

    EXPECT_DOUBLE_EQ(settings.similarity_threshold, 0.4);
    EXPECT_DOUBLE_EQ(settings.min_scene_seconds, 1.0);
    EXPECT_EQ(settings.budget_policy, BudgetPolicy::STRICT);
    EXPECT_DOUBLE_EQ(settings.target_duration_seconds, 30.0);
    EXPECT_EQ(settings.stride_frames, 30);
    EXPECT_EQ(ConfigManager::getInstance().getLogLevel(), "DEBUG");
}

TEST_F(ConfigManagerTest, InvalidValuesAreRejected)
{
    writeFile("bad_threshold.yaml", "log_level: INFO\nscenes:\n  similarity_threshold: 1.5\n");
    EXPECT_FALSE(ConfigManager::getInstance().loadConfig(testPath("bad_threshold.yaml")));

    writeFile("bad_policy.yaml", "log_level: INFO\nselection:\n  budget_policy: greedy\n");
    EXPECT_FALSE(ConfigManager::getInstance().loadConfig(testPath("bad_policy.yaml")));

    writeFile("bad_level.yaml", "log_level: LOUD\n");
    EXPECT_FALSE(ConfigManager::getInstance().loadConfig(testPath("bad_level.yaml")));

    // Nothing of the rejected files took effect
    EXPECT_DOUBLE_EQ(ConfigManager::getInstance().pipelineSettings().similarity_threshold, 0.25);
}

TEST_F(ConfigManagerTest, UpdatePublishesPipelineEvents)
{
    auto &config = ConfigManager::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    YAML::Node update;
    update["scenes"]["merge_gap_seconds"] = 3.5;
    config.updateConfig(update);

    // Same value again is not a change
    config.updateConfig(update);
    config.unsubscribe(&observer);

    ASSERT_EQ(observer.events.size(), 1u);
    EXPECT_EQ(observer.events[0].type, ConfigEventType::PIPELINE_CONFIG_CHANGED);
    EXPECT_EQ(observer.events[0].key, "scenes");
    EXPECT_DOUBLE_EQ(config.pipelineSettings().merge_gap_seconds, 3.5);
    // Sibling keys survive a partial section update
    EXPECT_DOUBLE_EQ(config.pipelineSettings().min_scene_seconds, 1.0);
}

TEST_F(ConfigManagerTest, LoggerObserverAppliesLogLevel)
{
    auto &config = ConfigManager::getInstance();
    auto observer = std::make_unique<LoggerObserver>();
    config.subscribe(observer.get());

    config.setLogLevel("WARN");
    EXPECT_EQ(Logger::getLevelName(), "WARN");

    config.setLogLevel("DEBUG");
    EXPECT_EQ(Logger::getLevelName(), "DEBUG");

    config.unsubscribe(observer.get());
}

TEST_F(ConfigManagerTest, MalformedValueFallsBackToDefault)
{
    YAML::Node update;
    update["threading"]["max_workers"] = "many";
    ConfigManager::getInstance().updateConfig(update);

    EXPECT_EQ(ConfigManager::getInstance().pipelineSettings().max_workers, 2);
}
