#pragma once

#include "core/config_manager.hpp"

/**
 * @brief Re-applies the log level whenever the configuration changes it
 */
class LoggerObserver : public ConfigObserver
{
public:
    LoggerObserver() = default;
    ~LoggerObserver() override = default;

    void onConfigChanged(const ConfigEvent &event) override;
};
