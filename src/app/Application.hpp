#pragma once

#include "config/AppSettings.hpp"

#include <iosfwd>
#include <string>

// Command-line front end: parses arguments, loads config.toml, sets up logging,
// runs one verification and prints the JSON report (or error body) on stdout.
class Application
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitInvalidInput = 2;

    Application(int argc, char** argv);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int run();

private:
    struct Options
    {
        std::string ocr;          // JSON text or @file
        std::string user;         // JSON text or @file
        std::string request_file; // envelope file
        std::string config_path = "config.toml";
        bool pretty = false;
        bool serial = false;
        bool help = false;
        bool version = false;
    };

    bool parseArguments(std::string& outError);
    void loadConfiguration();
    bool initializeLogging();
    int verify();
    int emitError(const std::string& message, int exit_code);
    bool resolveArgument(const std::string& value, std::string& outContent, std::string& outError) const;
    void flushErrorReports() const;
    void printUsage(std::ostream& os) const;

    int argc_;
    char** argv_;
    Options options_;
    AppSettings settings_;
};
