#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        bool valid = true;
        getLogger()->set_level(toSpdlogLevel(log_level, valid));
        getLogger()->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
    }

    static void setLevel(const std::string &log_level)
    {
        bool valid = true;
        auto level = toSpdlogLevel(log_level, valid);
        if (!valid)
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
        getLogger()->set_level(level);
        info("Log level changed to: " + log_level);
    }

    /**
     * @brief Name of the level currently applied to the logger
     */
    static std::string getLevelName()
    {
        switch (getLogger()->level())
        {
        case spdlog::level::trace:
            return "TRACE";
        case spdlog::level::debug:
            return "DEBUG";
        case spdlog::level::warn:
            return "WARN";
        case spdlog::level::err:
            return "ERROR";
        default:
            return "INFO";
        }
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("video_summarizer");
        return logger;
    }

    // Accepts upper or lower case names; unknown names map to info
    static spdlog::level::level_enum toSpdlogLevel(std::string name, bool &valid)
    {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        valid = true;
        if (name == "TRACE")
            return spdlog::level::trace;
        if (name == "DEBUG")
            return spdlog::level::debug;
        if (name == "INFO")
            return spdlog::level::info;
        if (name == "WARN" || name == "WARNING")
            return spdlog::level::warn;
        if (name == "ERROR")
            return spdlog::level::err;
        valid = false;
        return spdlog::level::info;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }
};
