#pragma once

#include "ErrorReporter.hpp"

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <exception>
#include <plog/Severity.h>
#include <plog/Init.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// [logging] section of config.toml
struct LoggingSettings
{
    plog::Severity level = plog::info;
    bool append = true;
    std::string file = "logs/fieldverify.log";
    std::string diagnostics_file = "logs/verification.log";
    bool console = false;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t backup_count = 3;
};

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Applies the settings for the next RegisterLogger calls; may be called again
    static bool Initialize(const LoggingSettings& settings);

    // plog loggers are process-wide: registering an instance twice only updates its level
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static bool PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static plog::IAppender* CreateFileAppender(const LoggerConfig& config);
    static plog::IAppender* CreateConsoleAppender();

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    plog::Severity level = config.level_override.value_or(s_default_level);

    if (auto logger = plog::get<InstanceId>())
    {
        logger->setMaxSeverity(level);
        return true;
    }

    try
    {
        plog::init<InstanceId>(level, CreateFileAppender(config));

        if (config.add_console_appender)
        {
            plog::get<InstanceId>()->addAppender(CreateConsoleAppender());
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

} // namespace utils
