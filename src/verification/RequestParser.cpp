#include "RequestParser.hpp"
#include "Diagnostics.hpp"

#include <plog/Log.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace verification
{

namespace
{

constexpr const char* kMissingDataMessage = "Missing data for verification";

} // namespace

RequestStatus RequestParser::parse(const std::string& jsonContent, VerificationRequest& outRequest,
                                   std::string& outError)
{
    try
    {
        json body = json::parse(jsonContent);
        if (!body.is_object())
        {
            outError = kMissingDataMessage;
            PLOG_WARNING << "Request body is " << body.type_name() << ", expected an object";
            return RequestStatus::MissingData;
        }

        outRequest.ocrData = body.contains("ocrData") ? body["ocrData"] : json();
        outRequest.userData = body.contains("userData") ? body["userData"] : json();

        return validate(outRequest, outError);
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return RequestStatus::ParseError;
    }
}

RequestStatus RequestParser::parseFile(const std::string& filePath, VerificationRequest& outRequest,
                                       std::string& outError)
{
    std::string content;
    if (!readFile(filePath, content, outError))
    {
        return RequestStatus::ParseError;
    }
    return parse(content, outRequest, outError);
}

RequestStatus RequestParser::parseParts(const std::string& ocrJson, const std::string& userJson,
                                        VerificationRequest& outRequest, std::string& outError)
{
    try
    {
        outRequest.ocrData = json::parse(ocrJson);
        outRequest.userData = json::parse(userJson);
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return RequestStatus::ParseError;
    }

    PLOG_DEBUG << "OCR Data: " << Diagnostics::Preview(ocrJson);
    PLOG_DEBUG << "User Data: " << Diagnostics::Preview(userJson);

    return validate(outRequest, outError);
}

RequestStatus RequestParser::validate(const VerificationRequest& request, std::string& outError)
{
    if (request.ocrData.is_null() || request.userData.is_null())
    {
        outError = kMissingDataMessage;
        PLOG_WARNING << outError << " (ocrData " << (request.ocrData.is_null() ? "missing" : "present")
                     << ", userData " << (request.userData.is_null() ? "missing" : "present") << ")";
        return RequestStatus::MissingData;
    }
    return RequestStatus::Ok;
}

bool RequestParser::readFile(const std::string& filePath, std::string& outContent, std::string& outError)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open())
    {
        outError = "Failed to open file: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad())
    {
        outError = "Failed to read file: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    outContent = buffer.str();
    return true;
}

} // namespace verification
