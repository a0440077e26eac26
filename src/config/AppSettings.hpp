#pragma once

#include "../utils/LogManager.hpp"
#include "../verification/VerificationEngine.hpp"

#include <cstddef>

class ConfigManager;

struct DiagnosticsSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;
};

struct AppSettings
{
    utils::LoggingSettings logging;
    DiagnosticsSettings diagnostics;
    verification::EngineOptions engine;
};

// Registers the [logging], [diagnostics] and [engine] handlers that fill `settings`.
// `settings` must outlive every ConfigManager::load() call.
bool registerAppSettings(ConfigManager& manager, AppSettings& settings);
