#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace verification
{

enum class RequestStatus
{
    Ok,
    MissingData, // client error: ocrData or userData absent
    ParseError   // body or file could not be read as JSON
};

// A verification request envelope: { "ocrData": ..., "userData": ... }
struct VerificationRequest
{
    nlohmann::json ocrData;
    nlohmann::json userData;
};

// Parser for verification request bodies
class RequestParser
{
public:
    RequestParser() = default;
    ~RequestParser() = default;

    // Parse an envelope from a JSON string
    RequestStatus parse(const std::string& jsonContent, VerificationRequest& outRequest, std::string& outError);

    // Parse an envelope from a file
    RequestStatus parseFile(const std::string& filePath, VerificationRequest& outRequest, std::string& outError);

    // Build a request from two separate JSON documents (CLI --ocr / --user)
    RequestStatus parseParts(const std::string& ocrJson, const std::string& userJson, VerificationRequest& outRequest,
                             std::string& outError);

    // Both halves must be present and non-null
    static RequestStatus validate(const VerificationRequest& request, std::string& outError);

    // Reads a whole file into a string; false with outError on failure
    static bool readFile(const std::string& filePath, std::string& outContent, std::string& outError);
};

} // namespace verification
