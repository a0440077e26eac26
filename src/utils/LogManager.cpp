#include "LogManager.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
// Outlives the plog loggers, which are function-local statics created on first registration
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LoggingSettings& settings)
{
    s_append_logs = settings.append;
    s_default_level = settings.level;

    if (!PrepareLogDirectory(settings.file))
        return false;
    if (settings.diagnostics_file != settings.file && !PrepareLogDirectory(settings.diagnostics_file))
        return false;

    s_initialized = true;
    return true;
}

plog::IAppender* LogManager::CreateFileAppender(const LoggerConfig& config)
{
    bool append = config.append_override.value_or(s_append_logs);
    if (!append)
    {
        std::ofstream(config.filepath, std::ios::trunc).close();
    }

    auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
        config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
    s_appenders.push_back(std::move(file_appender));
    return s_appenders.back().get();
}

plog::IAppender* LogManager::CreateConsoleAppender()
{
    // stdout carries the report; log lines go to stderr
    s_appenders.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr));
    return s_appenders.back().get();
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    std::filesystem::path dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
