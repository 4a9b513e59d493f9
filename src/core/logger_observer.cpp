#include "core/logger_observer.hpp"
#include "logging/logger.hpp"

void LoggerObserver::onConfigChanged(const ConfigEvent &event)
{
    if (event.type != ConfigEventType::LOG_LEVEL_CHANGED)
    {
        return;
    }

    try
    {
        std::string new_log_level = event.new_value.as<std::string>();
        Logger::info("LoggerObserver: log level configuration change detected to: " + new_log_level);
        Logger::setLevel(new_log_level);
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("LoggerObserver: error updating log level: " + std::string(e.what()));
    }
}
