#include <catch2/catch_test_macros.hpp>
#include "verification/RequestParser.hpp"

#include <filesystem>
#include <fstream>

using namespace verification;

namespace fs = std::filesystem;

// Test fixture for temporary request files
class TempRequestFile
{
public:
    explicit TempRequestFile(const std::string& content)
    {
        test_dir_ = "test_temp_requests";
        fs::create_directories(test_dir_);
        file_path_ = test_dir_ + "/request.json";
        std::ofstream file(file_path_);
        file << content;
        file.close();
    }

    ~TempRequestFile()
    {
        if (fs::exists(file_path_))
        {
            fs::remove(file_path_);
        }
        if (fs::exists(test_dir_) && fs::is_empty(test_dir_))
        {
            fs::remove(test_dir_);
        }
    }

    const std::string& path() const { return file_path_; }

private:
    std::string file_path_;
    std::string test_dir_;
};

TEST_CASE("RequestParser - Envelope", "[request]")
{
    RequestParser parser;
    VerificationRequest request;
    std::string error;

    SECTION("Both halves present")
    {
        auto status = parser.parse(R"({"ocrData": {"name": "Jon"}, "userData": {"name": "John"}})", request, error);
        REQUIRE(status == RequestStatus::Ok);
        REQUIRE(request.ocrData["name"] == "Jon");
        REQUIRE(request.userData["name"] == "John");
    }

    SECTION("Empty objects are present, not missing")
    {
        auto status = parser.parse(R"({"ocrData": {}, "userData": {}})", request, error);
        REQUIRE(status == RequestStatus::Ok);
    }

    SECTION("Missing half is a client error")
    {
        auto status = parser.parse(R"({"ocrData": {"name": "Jon"}})", request, error);
        REQUIRE(status == RequestStatus::MissingData);
        REQUIRE(error == "Missing data for verification");
    }

    SECTION("Null half is a client error")
    {
        auto status = parser.parse(R"({"ocrData": null, "userData": {"name": "John"}})", request, error);
        REQUIRE(status == RequestStatus::MissingData);
    }

    SECTION("Non-object body is a client error")
    {
        REQUIRE(parser.parse("[1, 2]", request, error) == RequestStatus::MissingData);
    }

    SECTION("Invalid JSON is a parse error")
    {
        auto status = parser.parse("{\"ocrData\": ", request, error);
        REQUIRE(status == RequestStatus::ParseError);
        REQUIRE(error.find("JSON parse error") != std::string::npos);
    }
}

TEST_CASE("RequestParser - Separate documents", "[request]")
{
    RequestParser parser;
    VerificationRequest request;
    std::string error;

    REQUIRE(parser.parseParts(R"({"city": "Pune"})", R"({"city": "pune"})", request, error) == RequestStatus::Ok);
    REQUIRE(request.userData["city"] == "pune");

    REQUIRE(parser.parseParts("null", R"({"city": "pune"})", request, error) == RequestStatus::MissingData);
    REQUIRE(parser.parseParts("{", "{}", request, error) == RequestStatus::ParseError);
}

TEST_CASE("RequestParser - Files", "[request]")
{
    RequestParser parser;
    VerificationRequest request;
    std::string error;

    SECTION("Reads an envelope from disk")
    {
        TempRequestFile file(R"({"ocrData": {"email": ""}, "userData": {"email": "a@b.com"}})");
        REQUIRE(parser.parseFile(file.path(), request, error) == RequestStatus::Ok);
        REQUIRE(request.userData["email"] == "a@b.com");
    }

    SECTION("Unreadable file is reported")
    {
        auto status = parser.parseFile("test_temp_requests/does_not_exist.json", request, error);
        REQUIRE(status == RequestStatus::ParseError);
        REQUIRE(error.find("Failed to open file") != std::string::npos);
    }
}
