#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>
#include <vector>

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

    /**
     * @brief Configure the level and, optionally, a log file that receives
     * the same records as the console
     */
    static void init(const std::string &log_level = "INFO", const std::string &log_file = "")
    {
        if (!log_file.empty())
        {
            try
            {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
                getLogger()->sinks().push_back(file_sink);
            }
            catch (const spdlog::spdlog_ex &e)
            {
                warn("Could not open log file " + log_file + ": " + e.what());
            }
        }

        getLogger()->set_level(parseLevel(log_level));
    }

    static bool isValidLevel(const std::string &log_level)
    {
        static const std::vector<std::string> names = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
        for (const auto &name : names)
        {
            if (name == log_level)
                return true;
        }
        return false;
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
        static auto logger = []()
        {
            auto existing = spdlog::get("tree_uploader");
            return existing ? existing : spdlog::stdout_color_mt("tree_uploader");
        }();
        return logger;
    }

    static spdlog::level::level_enum parseLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;
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
