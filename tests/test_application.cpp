#include <catch2/catch_test_macros.hpp>
#include "app/Application.hpp"
#include "utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{

constexpr const char* kTestDir = "test_temp_cli";
constexpr const char* kMissingConfig = "test_temp_cli/no_config.toml";

// Redirects a stream into a buffer for the lifetime of the object
class StreamCapture
{
public:
    explicit StreamCapture(std::ostream& stream)
        : stream_(stream)
        , previous_(stream.rdbuf(buffer_.rdbuf()))
    {
    }

    ~StreamCapture() { stream_.rdbuf(previous_); }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string text() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

struct RunResult
{
    int exit_code = -1;
    std::string out;
    std::string err;
};

RunResult runCli(std::vector<std::string> args)
{
    args.insert(args.begin(), "fieldverify");
    std::vector<char*> argv;
    for (auto& arg : args)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    utils::ErrorReporter::ClearErrors();

    RunResult result;
    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    result.exit_code = Application(static_cast<int>(args.size()), argv.data()).run();
    result.out = out.text();
    result.err = err.text();
    return result;
}

// Test fixture for temporary input documents
class TempInputFile
{
public:
    TempInputFile(const std::string& name, const std::string& content)
    {
        fs::create_directories(kTestDir);
        file_path_ = std::string(kTestDir) + "/" + name;
        std::ofstream file(file_path_);
        file << content;
        file.close();
    }

    ~TempInputFile()
    {
        if (fs::exists(file_path_))
        {
            fs::remove(file_path_);
        }
        if (fs::exists(kTestDir) && fs::is_empty(kTestDir))
        {
            fs::remove(kTestDir);
        }
    }

    const std::string& path() const { return file_path_; }

private:
    std::string file_path_;
};

} // namespace

TEST_CASE("Application - Usage", "[cli]")
{
    SECTION("Help goes to stdout and succeeds")
    {
        auto result = runCli({ "--help" });
        REQUIRE(result.exit_code == Application::kExitOk);
        REQUIRE(result.out.find("Usage:") != std::string::npos);
    }

    SECTION("Version is printed")
    {
        auto result = runCli({ "--version" });
        REQUIRE(result.exit_code == Application::kExitOk);
        REQUIRE(result.out.rfind("fieldverify ", 0) == 0);
    }

    SECTION("No arguments is a usage error")
    {
        auto result = runCli({});
        REQUIRE(result.exit_code == Application::kExitInvalidInput);
        REQUIRE(result.out.empty());
        REQUIRE(result.err.find("Usage:") != std::string::npos);
    }

    SECTION("Unknown argument is a usage error")
    {
        auto result = runCli({ "--frobnicate" });
        REQUIRE(result.exit_code == Application::kExitInvalidInput);
        REQUIRE(result.err.find("Unknown argument: --frobnicate") != std::string::npos);
    }

    SECTION("Request file cannot be mixed with inline documents")
    {
        auto result = runCli({ "--request", "req.json", "--ocr", "{}" });
        REQUIRE(result.exit_code == Application::kExitInvalidInput);
        REQUIRE(result.err.find("--request cannot be combined") != std::string::npos);
    }

    SECTION("Missing option value")
    {
        auto result = runCli({ "--ocr", "{}", "--user" });
        REQUIRE(result.exit_code == Application::kExitInvalidInput);
        REQUIRE(result.err.find("--user requires a value") != std::string::npos);
    }
}

TEST_CASE("Application - Verification output", "[cli]")
{
    SECTION("Matching documents print a report and succeed")
    {
        auto result = runCli({ "--config", kMissingConfig, "--ocr", R"({"name": "Jon Smith"})", "--user",
                               R"({"name": "Jon Smith"})" });
        REQUIRE(result.exit_code == Application::kExitOk);

        json report = json::parse(result.out);
        REQUIRE(report["totalFields"] == 1);
        REQUIRE(report["matchedFields"] == 1);
        REQUIRE(report["results"][0]["status"] == "Match");
        REQUIRE(report["results"][0]["combinedScore"] == "100.00");
    }

    SECTION("Equals form and @file arguments")
    {
        TempInputFile ocr("ocr.json", R"({"city": "Pune", "city_confidence": 60})");
        TempInputFile user("user.json", R"({"city": "pune"})");

        auto result = runCli({ "--config=" + std::string(kMissingConfig), "--serial", "--ocr=@" + ocr.path(),
                               "--user=@" + user.path() });
        REQUIRE(result.exit_code == Application::kExitOk);

        json report = json::parse(result.out);
        REQUIRE(report["results"][0]["field"] == "city");
        REQUIRE(report["results"][0]["combinedScore"] == "82.00");
        REQUIRE(report["results"][0]["status"] == "PartialMatch");
    }

    SECTION("Request envelope file")
    {
        TempInputFile request("request.json", R"({"ocrData": {"name": "Jon Smith", "name_confidence": 80},
                                                  "userData": {"name": "John Smith"}})");

        auto result = runCli({ "--config", kMissingConfig, "--request", request.path() });
        REQUIRE(result.exit_code == Application::kExitOk);
        REQUIRE(json::parse(result.out)["results"][0]["combinedScore"] == "85.50");
    }

    SECTION("Pretty output is indented")
    {
        auto result = runCli({ "--config", kMissingConfig, "--pretty", "--ocr", R"({"a": "x"})", "--user",
                               R"({"a": "x"})" });
        REQUIRE(result.exit_code == Application::kExitOk);
        REQUIRE(result.out.find("\n  \"") != std::string::npos);
    }
}

TEST_CASE("Application - Error exits", "[cli][errors]")
{
    auto requireErrorBody = [](const std::string& out)
    {
        json body = json::parse(out);
        REQUIRE(body.contains("error"));
        REQUIRE(body["results"].empty());
        REQUIRE(body["averageConfidence"] == 0);
        return body["error"].get<std::string>();
    };

    SECTION("Null document is missing data")
    {
        auto result = runCli({ "--config", kMissingConfig, "--ocr", "null", "--user", R"({"a": "x"})" });
        REQUIRE(result.exit_code == Application::kExitInvalidInput);
        REQUIRE(requireErrorBody(result.out) == "Missing data for verification");
    }

    SECTION("Two empty documents are rejected")
    {
        auto result = runCli({ "--config", kMissingConfig, "--ocr", "{}", "--user", "{}" });
        REQUIRE(result.exit_code == Application::kExitInvalidInput);
        REQUIRE(requireErrorBody(result.out).find("Missing data for verification") == 0);
    }

    SECTION("Malformed JSON is a failure")
    {
        auto result = runCli({ "--config", kMissingConfig, "--ocr", "{", "--user", "{}" });
        REQUIRE(result.exit_code == Application::kExitFailure);
        REQUIRE(requireErrorBody(result.out).find("JSON parse error") == 0);
    }

    SECTION("Unreadable @file is a failure")
    {
        auto result = runCli({ "--config", kMissingConfig, "--ocr", "@test_temp_cli/absent.json", "--user", "{}" });
        REQUIRE(result.exit_code == Application::kExitFailure);
        REQUIRE(requireErrorBody(result.out).find("Failed to open file") == 0);
        REQUIRE(result.err.find("Could not read verification input") != std::string::npos);
    }
}
