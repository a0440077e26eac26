#include "AppSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <string>

namespace
{

void reportInvalid(const std::string& key, const std::string& expected)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Ignoring invalid setting " + key,
                                        "expected " + expected);
}

void readBool(const toml::table& section, const std::string& path, const char* key, bool& target)
{
    const toml::node* node = section.get(key);
    if (!node)
        return;
    if (auto value = node->value_exact<bool>())
        target = *value;
    else
        reportInvalid(path + "." + key, "a boolean");
}

void readSize(const toml::table& section, const std::string& path, const char* key, std::size_t& target,
              std::int64_t min_value)
{
    const toml::node* node = section.get(key);
    if (!node)
        return;
    auto value = node->is_integer() ? node->value<std::int64_t>() : std::nullopt;
    if (value && *value >= min_value)
        target = static_cast<std::size_t>(*value);
    else
        reportInvalid(path + "." + key, "an integer >= " + std::to_string(min_value));
}

void readString(const toml::table& section, const std::string& path, const char* key, std::string& target)
{
    const toml::node* node = section.get(key);
    if (!node)
        return;
    auto value = node->value_exact<std::string>();
    if (value && !value->empty())
        target = *value;
    else
        reportInvalid(path + "." + key, "a non-empty string");
}

void loadLogging(const toml::table& section, utils::LoggingSettings& logging)
{
    if (const toml::node* node = section.get("level"))
    {
        auto level = node->is_integer() ? node->value<std::int64_t>() : std::nullopt;
        if (level && *level >= 0 && *level <= 6)
            logging.level = static_cast<plog::Severity>(*level);
        else
            reportInvalid("logging.level", "an integer 0..6");
    }
    readBool(section, "logging", "append", logging.append);
    readString(section, "logging", "file", logging.file);
    readString(section, "logging", "diagnostics_file", logging.diagnostics_file);
    readBool(section, "logging", "console", logging.console);
    readSize(section, "logging", "max_file_size", logging.max_file_size, 1);
    readSize(section, "logging", "backup_count", logging.backup_count, 0);
}

} // namespace

bool registerAppSettings(ConfigManager& manager, AppSettings& settings)
{
    bool ok = manager.registerTable("logging", { [&settings](const toml::table& section)
                                                 { loadLogging(section, settings.logging); } });

    ok = manager.registerTable("diagnostics", { [&settings](const toml::table& section)
                                                {
                                                    readBool(section, "diagnostics", "verbose",
                                                             settings.diagnostics.verbose);
                                                    readSize(section, "diagnostics", "max_preview",
                                                             settings.diagnostics.max_preview, 1);
                                                } }) && ok;

    ok = manager.registerTable("engine", { [&settings](const toml::table& section)
                                           {
                                               readBool(section, "engine", "parallel", settings.engine.parallel);
                                               readSize(section, "engine", "max_workers",
                                                        settings.engine.max_workers, 0);
                                               readSize(section, "engine", "parallel_min_fields",
                                                        settings.engine.parallel_min_fields, 1);
                                           } }) && ok;
    return ok;
}
