#include "VerificationTypes.hpp"

#include <cmath>

namespace verification
{

const char* toString(FieldStatus status)
{
    switch (status)
    {
    case FieldStatus::Match:
        return "Match";
    case FieldStatus::PartialMatch:
        return "PartialMatch";
    case FieldStatus::Mismatch:
        return "Mismatch";
    case FieldStatus::NotProvided:
        return "NotProvided";
    case FieldStatus::UserAdded:
        return "UserAdded";
    case FieldStatus::OcrPresent:
        return "OcrPresent";
    default:
        return "Unknown";
    }
}

double roundScore(double value)
{
    return std::round(value * 100.0) / 100.0;
}

} // namespace verification
