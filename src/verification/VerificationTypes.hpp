#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace verification
{

// Core data contracts shared by the reconciler, the per-field pipeline and the aggregator.

using FieldKey = std::string;

enum class FieldStatus
{
    Match,        // combined score >= 95
    PartialMatch, // 75 <= combined score < 95
    Mismatch,     // combined score < 75
    NotProvided,  // neither side has a value
    UserAdded,    // only the user has a value
    OcrPresent    // only OCR has a value
};

// One OCR field after shape normalization
struct OcrField
{
    std::string value;
    double confidence = 0.0; // [0, 100], 0 when the OCR stage reported none
};

// Paired raw inputs for one field, produced by the reconciler in key order
struct ReconciledField
{
    FieldKey key;
    std::string ocrValue;
    double ocrConfidence = 0.0;
    std::string userValue;
};

struct VerificationOutcome
{
    FieldKey field;
    std::string ocrValue;         // trimmed
    std::string userValue;        // trimmed
    double similarity = 0.0;      // [0, 100], rounded to 2 decimals
    double ocrConfidence = 0.0;   // [0, 100]
    double combinedScore = 0.0;   // [0, 100], rounded to 2 decimals
    FieldStatus status = FieldStatus::NotProvided;
    std::string notes;
};

struct VerificationReport
{
    std::vector<VerificationOutcome> results;
    double averageConfidence = 0.0;
    std::size_t totalFields = 0;
    std::size_t matchedFields = 0;
    std::size_t partialMatchFields = 0;
    std::size_t mismatchFields = 0;
};

// Raised when neither side of a verification request carries any data
class InvalidInputError : public std::invalid_argument
{
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

const char* toString(FieldStatus status);

/// Rounds a score half away from zero to two decimals
double roundScore(double value);

} // namespace verification
