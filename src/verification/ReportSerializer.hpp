#pragma once

#include "VerificationTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace verification
{

/// Two-decimal fixed rendering used for every score string, e.g. "85.50"
[[nodiscard]] std::string formatScore(double value);

/// Report in the wire contract: scores as two-decimal strings, counts as integers
[[nodiscard]] nlohmann::json reportToJson(const VerificationReport& report);

[[nodiscard]] nlohmann::json outcomeToJson(const VerificationOutcome& outcome);

/// Error body: { "error": message, "results": [], "averageConfidence": 0 }
[[nodiscard]] nlohmann::json errorToJson(const std::string& message);

/// Compact when indent < 0. Invalid UTF-8 is replaced rather than thrown on.
[[nodiscard]] std::string renderJson(const nlohmann::json& document, int indent = -1);

} // namespace verification
