#include "core/config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace
{
    const std::vector<std::string> kPipelineSections = {
        "threading", "sampling", "embedding", "scenes", "selection", "composer", "storage", "validation"};

    bool isValidLogLevel(const std::string &level)
    {
        std::string upper = level;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return upper == "TRACE" || upper == "DEBUG" || upper == "INFO" || upper == "WARN" ||
               upper == "WARNING" || upper == "ERROR";
    }
}

ConfigManager::ConfigManager()
{
    config_ = defaultConfig();
}

ConfigManager &ConfigManager::getInstance()
{
    static ConfigManager instance;
    return instance;
}

YAML::Node ConfigManager::defaultConfig()
{
    return YAML::Load(R"(
        log_level: "INFO"
        threading:
          max_workers: 2
        sampling:
          stride_frames: 30
          stride_seconds: 0
          max_frame_side: 448
        embedding:
          visual_model_path: "models/clip_visual.onnx"
          text_model_path: "models/clip_text.onnx"
          tokenizer_path: "models/tokenizer.json"
          batch_size: 16
          intra_op_threads: 2
        scenes:
          similarity_threshold: 0.25
          min_scene_seconds: 1.0
          merge_gap_seconds: 2.0
        selection:
          target_duration_seconds: 60
          budget_policy: "admit_then_stop"
        composer:
          output_format: "mp4"
          prefer_stream_copy: true
          max_retries: 3
          retry_backoff_ms: 100
        storage:
          scratch_dir: "scratch"
          artifact_dir: "summaries"
          database_path: "summaries.db"
        validation:
          max_prompt_length: 500
          max_title_length: 200
          max_ranges: 64
    )");
}

template <typename T>
T ConfigManager::readValue(const YAML::Node &config, const std::string &section, const std::string &key,
                           const T &fallback) const
{
    try
    {
        const YAML::Node section_node = section.empty() ? config : config[section];
        if (section_node && section_node[key])
        {
            return section_node[key].as<T>();
        }
    }
    catch (const YAML::Exception &e)
    {
        Logger::warn("Error parsing " + section + "." + key + ": " + std::string(e.what()) + ", using default");
    }
    return fallback;
}

std::string ConfigManager::getLogLevel() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return readValue<std::string>(config_, "", "log_level", "INFO");
}

YAML::Node ConfigManager::getConfig() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return YAML::Clone(config_);
}

std::string ConfigManager::getConfigPath() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

PipelineSettings ConfigManager::pipelineSettings() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    PipelineSettings defaults;
    PipelineSettings s;

    s.max_workers = readValue<int>(config_, "threading", "max_workers", defaults.max_workers);
    if (s.max_workers <= 0 || s.max_workers > 64)
    {
        Logger::warn("Invalid max_workers value: " + std::to_string(s.max_workers) +
                     ", using default: " + std::to_string(defaults.max_workers));
        s.max_workers = defaults.max_workers;
    }

    s.stride_frames = readValue<int>(config_, "sampling", "stride_frames", defaults.stride_frames);
    if (s.stride_frames <= 0)
    {
        Logger::warn("Invalid stride_frames value: " + std::to_string(s.stride_frames) + ", using default");
        s.stride_frames = defaults.stride_frames;
    }
    s.stride_seconds = std::max(0.0, readValue<double>(config_, "sampling", "stride_seconds", defaults.stride_seconds));
    s.max_frame_side = readValue<int>(config_, "sampling", "max_frame_side", defaults.max_frame_side);

    s.visual_model_path = readValue<std::string>(config_, "embedding", "visual_model_path", defaults.visual_model_path);
    s.text_model_path = readValue<std::string>(config_, "embedding", "text_model_path", defaults.text_model_path);
    s.tokenizer_path = readValue<std::string>(config_, "embedding", "tokenizer_path", defaults.tokenizer_path);
    s.embedding_batch_size = std::max(1, readValue<int>(config_, "embedding", "batch_size", defaults.embedding_batch_size));
    s.intra_op_threads = std::max(1, readValue<int>(config_, "embedding", "intra_op_threads", defaults.intra_op_threads));

    s.similarity_threshold = readValue<double>(config_, "scenes", "similarity_threshold", defaults.similarity_threshold);
    if (s.similarity_threshold < 0.0 || s.similarity_threshold > 1.0)
    {
        Logger::warn("similarity_threshold must lie in [0,1], using default");
        s.similarity_threshold = defaults.similarity_threshold;
    }
    s.min_scene_seconds = std::max(0.0, readValue<double>(config_, "scenes", "min_scene_seconds", defaults.min_scene_seconds));
    s.merge_gap_seconds = std::max(0.0, readValue<double>(config_, "scenes", "merge_gap_seconds", defaults.merge_gap_seconds));

    s.target_duration_seconds = readValue<double>(config_, "selection", "target_duration_seconds", defaults.target_duration_seconds);
    if (s.target_duration_seconds <= 0.0)
    {
        Logger::warn("target_duration_seconds must be positive, using default");
        s.target_duration_seconds = defaults.target_duration_seconds;
    }
    std::string policy = readValue<std::string>(config_, "selection", "budget_policy",
                                                BudgetPolicies::getPolicyName(defaults.budget_policy));
    if (!BudgetPolicies::fromString(policy, s.budget_policy))
    {
        Logger::warn("Unknown budget_policy: " + policy + ", using admit_then_stop");
        s.budget_policy = BudgetPolicy::ADMIT_THEN_STOP;
    }

    s.output_format = readValue<std::string>(config_, "composer", "output_format", defaults.output_format);
    s.prefer_stream_copy = readValue<bool>(config_, "composer", "prefer_stream_copy", defaults.prefer_stream_copy);
    s.max_retries = std::max(1, readValue<int>(config_, "composer", "max_retries", defaults.max_retries));
    s.retry_backoff_ms = std::max(0, readValue<int>(config_, "composer", "retry_backoff_ms", defaults.retry_backoff_ms));

    s.scratch_dir = readValue<std::string>(config_, "storage", "scratch_dir", defaults.scratch_dir);
    s.artifact_dir = readValue<std::string>(config_, "storage", "artifact_dir", defaults.artifact_dir);
    s.database_path = readValue<std::string>(config_, "storage", "database_path", defaults.database_path);

    s.max_prompt_length = readValue<std::size_t>(config_, "validation", "max_prompt_length", defaults.max_prompt_length);
    s.max_title_length = readValue<std::size_t>(config_, "validation", "max_title_length", defaults.max_title_length);
    s.max_ranges = readValue<std::size_t>(config_, "validation", "max_ranges", defaults.max_ranges);
    return s;
}

void ConfigManager::setLogLevel(const std::string &level)
{
    YAML::Node update;
    update["log_level"] = level;
    updateConfig(update);
}

void ConfigManager::updateConfig(const YAML::Node &new_config)
{
    std::vector<ConfigEvent> events;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        YAML::Node candidate = YAML::Clone(config_);
        for (auto it = new_config.begin(); it != new_config.end(); ++it)
        {
            const std::string key = it->first.as<std::string>();
            const YAML::Node existing = static_cast<const YAML::Node &>(candidate)[key];
            YAML::Node old_value = existing ? YAML::Clone(existing) : YAML::Node();

            if (existing && existing.IsMap() && it->second.IsMap())
            {
                for (auto sub = it->second.begin(); sub != it->second.end(); ++sub)
                {
                    candidate[key][sub->first.as<std::string>()] = YAML::Clone(sub->second);
                }
            }
            else
            {
                candidate[key] = YAML::Clone(it->second);
            }

            if (YAML::Dump(old_value) == YAML::Dump(candidate[key]))
            {
                continue;
            }

            ConfigEventType type = ConfigEventType::GENERAL_CONFIG_CHANGED;
            if (key == "log_level")
            {
                type = ConfigEventType::LOG_LEVEL_CHANGED;
            }
            else if (std::find(kPipelineSections.begin(), kPipelineSections.end(), key) != kPipelineSections.end())
            {
                type = ConfigEventType::PIPELINE_CONFIG_CHANGED;
            }
            events.push_back(ConfigEvent{type, key, old_value, YAML::Clone(candidate[key]),
                                         "Configuration key '" + key + "' changed"});
        }

        if (events.empty())
        {
            return;
        }
        if (!validateConfig(candidate))
        {
            Logger::warn("Ignored configuration update due to validation failure");
            return;
        }
        config_ = candidate;
        if (!config_path_.empty())
        {
            saveConfigInternal(config_path_, config_);
        }
    }

    // Observers may read the configuration back, so they run outside the lock
    for (const auto &event : events)
    {
        publishEvent(event);
    }
}

void ConfigManager::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
    Logger::debug("Configuration observer subscribed");
}

void ConfigManager::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::debug("Configuration observer unsubscribed");
}

void ConfigManager::publishEvent(const ConfigEvent &event)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    Logger::info("Publishing config event: " + event.description);
    for (auto observer : observers_)
    {
        try
        {
            observer->onConfigChanged(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}

bool ConfigManager::loadOrCreate(const std::string &file_path)
{
    if (!std::filesystem::exists(file_path))
    {
        Logger::info("Configuration file not found, creating default " + file_path);
        if (!saveConfigInternal(file_path, defaultConfig()))
        {
            Logger::error("Failed to save default configuration to: " + file_path);
            return false;
        }
    }
    return loadConfig(file_path);
}

bool ConfigManager::loadConfig(const std::string &file_path)
{
    YAML::Node loaded;
    try
    {
        loaded = YAML::LoadFile(file_path);
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Error loading config: " + std::string(e.what()));
        return false;
    }

    // Keys missing from the file keep their defaults
    YAML::Node merged = defaultConfig();
    for (auto it = loaded.begin(); it != loaded.end(); ++it)
    {
        const std::string key = it->first.as<std::string>();
        if (merged[key].IsMap() && it->second.IsMap())
        {
            for (auto sub = it->second.begin(); sub != it->second.end(); ++sub)
            {
                merged[key][sub->first.as<std::string>()] = sub->second;
            }
        }
        else
        {
            merged[key] = it->second;
        }
    }

    if (!validateConfig(merged))
    {
        Logger::error("Invalid configuration in file: " + file_path);
        return false;
    }

    std::string log_level;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = merged;
        config_path_ = file_path;
        log_level = readValue<std::string>(config_, "", "log_level", "INFO");
    }
    Logger::init(log_level);
    Logger::info("Configuration loaded from: " + file_path);
    return true;
}

bool ConfigManager::saveConfig(const std::string &file_path) const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return saveConfigInternal(file_path, config_);
}

bool ConfigManager::saveConfigInternal(const std::string &file_path, const YAML::Node &config) const
{
    try
    {
        std::ofstream file(file_path);
        if (!file.is_open())
        {
            Logger::error("Could not open config file for writing: " + file_path);
            return false;
        }
        file << config;
        Logger::debug("Configuration saved to: " + file_path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error saving config: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::validateConfig(const YAML::Node &config) const
{
    try
    {
        if (!config["log_level"] || !isValidLogLevel(config["log_level"].as<std::string>()))
        {
            Logger::error("Missing or invalid log_level");
            return false;
        }
        if (config["scenes"] && config["scenes"]["similarity_threshold"])
        {
            double threshold = config["scenes"]["similarity_threshold"].as<double>();
            if (threshold < 0.0 || threshold > 1.0)
            {
                Logger::error("Invalid similarity_threshold: " + std::to_string(threshold));
                return false;
            }
        }
        if (config["threading"] && config["threading"]["max_workers"])
        {
            int workers = config["threading"]["max_workers"].as<int>();
            if (workers <= 0 || workers > 64)
            {
                Logger::error("Invalid max_workers: " + std::to_string(workers));
                return false;
            }
        }
        if (config["selection"] && config["selection"]["budget_policy"])
        {
            BudgetPolicy policy;
            if (!BudgetPolicies::fromString(config["selection"]["budget_policy"].as<std::string>(), policy))
            {
                Logger::error("Invalid budget_policy");
                return false;
            }
        }
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Malformed configuration: " + std::string(e.what()));
        return false;
    }
    return true;
}

void ConfigManager::resetForTesting()
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = defaultConfig();
    config_path_.clear();
}
