#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <mutex>
#include <yaml-cpp/yaml.h>
#include "core/pipeline_settings.hpp"

/**
 * @brief Configuration change event types
 */
enum class ConfigEventType
{
    LOG_LEVEL_CHANGED,
    PIPELINE_CONFIG_CHANGED,
    GENERAL_CONFIG_CHANGED
};

/**
 * @brief Configuration change event
 */
struct ConfigEvent
{
    ConfigEventType type;
    std::string key;
    YAML::Node old_value;
    YAML::Node new_value;
    std::string description;
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigChanged(const ConfigEvent &event) = 0;
};

/**
 * @brief YAML configuration of the summarizer with reactive publishing
 */
class ConfigManager
{
public:
    static ConfigManager &getInstance();

    // Configuration getters
    std::string getLogLevel() const;
    YAML::Node getConfig() const;
    std::string getConfigPath() const;

    /**
     * @brief Snapshot every pipeline tunable into a plain struct
     * @return Settings with defaults for missing or malformed keys
     */
    PipelineSettings pipelineSettings() const;

    // Configuration setters with event publishing
    void setLogLevel(const std::string &level);

    /**
     * @brief Merge top-level keys of new_config and notify observers of each change
     * @param new_config Partial or complete configuration
     */
    void updateConfig(const YAML::Node &new_config);

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

    /**
     * @brief Load the file, writing the default configuration first when it does not exist
     * @param file_path Path of the YAML file
     * @return true when a valid configuration is in effect from the file
     */
    bool loadOrCreate(const std::string &file_path);

    // Configuration persistence
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;

    // Configuration validation
    bool validateConfig(const YAML::Node &config) const;

    // Restore built-in defaults and forget the file path
    void resetForTesting();

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    void publishEvent(const ConfigEvent &event);
    static YAML::Node defaultConfig();
    bool saveConfigInternal(const std::string &file_path, const YAML::Node &config) const;

    template <typename T>
    T readValue(const YAML::Node &config, const std::string &section, const std::string &key,
                const T &fallback) const;

    mutable std::mutex config_mutex_;
    YAML::Node config_;
    std::string config_path_;

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
};
