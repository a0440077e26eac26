#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"
#include "verification/Diagnostics.hpp"
#include "verification/ReportSerializer.hpp"
#include "verification/RequestParser.hpp"
#include "verification/VerificationEngine.hpp"

#include <plog/Log.h>

#include <iostream>

namespace
{

// Accepts "--name value" and "--name=value"
bool takeValue(const std::string& arg, const char* name, int& index, int argc, char** argv, std::string& out,
               std::string& outError)
{
    const std::string flag = name;
    if (arg == flag)
    {
        if (index + 1 >= argc)
        {
            outError = flag + " requires a value";
            return true;
        }
        out = argv[++index];
        return true;
    }
    if (arg.rfind(flag + "=", 0) == 0)
    {
        out = arg.substr(flag.size() + 1);
        return true;
    }
    return false;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

int Application::run()
{
    std::string arg_error;
    if (!parseArguments(arg_error))
    {
        std::cerr << "Error: " << arg_error << "\n";
        printUsage(std::cerr);
        return kExitInvalidInput;
    }

    if (options_.help)
    {
        printUsage(std::cout);
        return kExitOk;
    }

    if (options_.version)
    {
        std::cout << "fieldverify " << FIELDVERIFY_VERSION_STRING << "\n";
        return kExitOk;
    }

    loadConfiguration();
    if (!initializeLogging())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Continuing with incomplete logging");
    }

    int code = verify();
    flushErrorReports();
    return code;
}

bool Application::parseArguments(std::string& outError)
{
    for (int i = 1; i < argc_; ++i)
    {
        std::string arg = argv_[i];
        if (arg == "--help" || arg == "-h")
        {
            options_.help = true;
        }
        else if (arg == "--version")
        {
            options_.version = true;
        }
        else if (arg == "--pretty")
        {
            options_.pretty = true;
        }
        else if (arg == "--serial")
        {
            options_.serial = true;
        }
        else if (takeValue(arg, "--ocr", i, argc_, argv_, options_.ocr, outError) ||
                 takeValue(arg, "--user", i, argc_, argv_, options_.user, outError) ||
                 takeValue(arg, "--request", i, argc_, argv_, options_.request_file, outError) ||
                 takeValue(arg, "--config", i, argc_, argv_, options_.config_path, outError))
        {
            if (!outError.empty())
                return false;
        }
        else
        {
            outError = "Unknown argument: " + arg;
            return false;
        }
    }

    if (options_.help || options_.version)
        return true;

    if (!options_.request_file.empty())
    {
        if (!options_.ocr.empty() || !options_.user.empty())
        {
            outError = "--request cannot be combined with --ocr/--user";
            return false;
        }
        return true;
    }

    if (options_.ocr.empty() || options_.user.empty())
    {
        outError = "both --ocr and --user are required (or --request)";
        return false;
    }
    return true;
}

void Application::loadConfiguration()
{
    ConfigManager config(options_.config_path);
    if (!registerAppSettings(config, settings_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Settings handlers not registered",
                                            config.lastError());
    }
    if (!config.load())
    {
        // Already reported; defaults stay in effect
        settings_ = AppSettings{};
    }

    if (options_.serial)
    {
        settings_.engine.parallel = false;
    }

    verification::Diagnostics::SetVerbose(settings_.diagnostics.verbose);
    verification::Diagnostics::SetMaxPreview(settings_.diagnostics.max_preview);
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    const utils::LoggingSettings& logging = settings_.logging;
    if (!utils::LogManager::Initialize(logging))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            logging.file);
        return false;
    }

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filepath = logging.file,
                                                     .append_override = std::nullopt,
                                                     .level_override = std::nullopt,
                                                     .max_file_size = logging.max_file_size,
                                                     .backup_count = logging.backup_count,
                                                     .add_console_appender = logging.console });

    std::optional<plog::Severity> diagnostics_level;
    if (settings_.diagnostics.verbose)
    {
        diagnostics_level = plog::debug;
    }

    ok = utils::LogManager::RegisterLogger<verification::Diagnostics::kLogInstance>(
             { .name = "diagnostics",
               .filepath = logging.diagnostics_file,
               .append_override = std::nullopt,
               .level_override = diagnostics_level,
               .max_file_size = logging.max_file_size,
               .backup_count = logging.backup_count,
               .add_console_appender = false }) &&
         ok;

#if FIELDVERIFY_PROFILING_LEVEL >= 1
    ok = utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                              .filepath = "logs/profiling.log",
                                                                              .append_override = std::nullopt,
                                                                              .level_override = plog::debug,
                                                                              .max_file_size = logging.max_file_size,
                                                                              .backup_count = logging.backup_count,
                                                                              .add_console_appender = false }) &&
         ok;
#endif

    PLOG_INFO << "fieldverify " << FIELDVERIFY_VERSION_STRING << " starting (config: " << options_.config_path << ")";
    return ok;
}

int Application::verify()
{
    verification::RequestParser parser;
    verification::VerificationRequest request;
    std::string error;
    verification::RequestStatus status;

    if (!options_.request_file.empty())
    {
        status = parser.parseFile(options_.request_file, request, error);
    }
    else
    {
        std::string ocr_json;
        std::string user_json;
        if (!resolveArgument(options_.ocr, ocr_json, error) || !resolveArgument(options_.user, user_json, error))
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Could not read verification input", error);
            return emitError(error, kExitFailure);
        }
        status = parser.parseParts(ocr_json, user_json, request, error);
    }

    switch (status)
    {
    case verification::RequestStatus::Ok:
        break;
    case verification::RequestStatus::MissingData:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Verification request rejected", error);
        return emitError(error, kExitInvalidInput);
    case verification::RequestStatus::ParseError:
    default:
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Verification request is not valid JSON", error);
        return emitError(error, kExitFailure);
    }

    try
    {
        verification::VerificationEngine engine(settings_.engine);
        verification::VerificationReport report = engine.verify(request.ocrData, request.userData);
        std::cout << verification::renderJson(verification::reportToJson(report), options_.pretty ? 2 : -1) << "\n";
        return kExitOk;
    }
    catch (const verification::InvalidInputError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Verification request rejected", ex.what());
        return emitError(ex.what(), kExitInvalidInput);
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Verification, "Verification failed", ex.what());
        return emitError(ex.what(), kExitFailure);
    }
}

int Application::emitError(const std::string& message, int exit_code)
{
    std::cout << verification::renderJson(verification::errorToJson(message), options_.pretty ? 2 : -1) << "\n";
    return exit_code;
}

bool Application::resolveArgument(const std::string& value, std::string& outContent, std::string& outError) const
{
    if (!value.empty() && value[0] == '@')
    {
        return verification::RequestParser::readFile(value.substr(1), outContent, outError);
    }
    outContent = value;
    return true;
}

void Application::flushErrorReports() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
    }
}

void Application::printUsage(std::ostream& os) const
{
    const char* program = argc_ > 0 ? argv_[0] : "fieldverify";
    os << "Usage: " << program << " --ocr <json|@file> --user <json|@file> [options]\n"
       << "       " << program << " --request <file> [options]\n"
       << "\n"
       << "Compares OCR-extracted fields with user-corrected fields and prints a JSON report.\n"
       << "\n"
       << "Options:\n"
       << "  --config <path>  configuration file (default: config.toml)\n"
       << "  --pretty         indent the JSON output\n"
       << "  --serial         score fields on the calling thread only\n"
       << "  --version        print the version and exit\n"
       << "  -h, --help       show this help\n";
}
