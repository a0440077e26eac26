#include "ReportSerializer.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <locale>
#include <sstream>

using json = nlohmann::json;

namespace verification
{

namespace
{

// Integral confidences print as integers (80, not 80.0)
json numberToJson(double value)
{
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15)
    {
        return static_cast<std::int64_t>(value);
    }
    return value;
}

} // namespace

std::string formatScore(double value)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    // Avoid "-0.00" from tiny negative rounding residue
    double rounded = roundScore(value);
    if (rounded == 0.0)
        rounded = 0.0;
    ss << std::fixed << std::setprecision(2) << rounded;
    return ss.str();
}

json outcomeToJson(const VerificationOutcome& outcome)
{
    return json{
        { "field", outcome.field },
        { "ocrValue", outcome.ocrValue },
        { "userValue", outcome.userValue },
        { "similarity", formatScore(outcome.similarity) },
        { "ocr_confidence", numberToJson(outcome.ocrConfidence) },
        { "combinedScore", formatScore(outcome.combinedScore) },
        { "status", toString(outcome.status) },
        { "notes", outcome.notes }
    };
}

json reportToJson(const VerificationReport& report)
{
    json results = json::array();
    for (const auto& outcome : report.results)
    {
        results.push_back(outcomeToJson(outcome));
    }

    return json{
        { "results", std::move(results) },
        { "averageConfidence", formatScore(report.averageConfidence) },
        { "totalFields", report.totalFields },
        { "matchedFields", report.matchedFields },
        { "partialMatchFields", report.partialMatchFields },
        { "mismatchFields", report.mismatchFields }
    };
}

json errorToJson(const std::string& message)
{
    return json{
        { "error", message },
        { "results", json::array() },
        { "averageConfidence", 0 }
    };
}

std::string renderJson(const json& document, int indent)
{
    return document.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace verification
