#include "ReportAggregator.hpp"

namespace verification
{

VerificationReport aggregateReport(std::vector<VerificationOutcome> outcomes)
{
    VerificationReport report;
    report.results = std::move(outcomes);
    report.totalFields = report.results.size();

    double total_score = 0.0;
    for (const auto& outcome : report.results)
    {
        total_score += outcome.combinedScore;
        switch (outcome.status)
        {
        case FieldStatus::Match:
            ++report.matchedFields;
            break;
        case FieldStatus::PartialMatch:
            ++report.partialMatchFields;
            break;
        case FieldStatus::Mismatch:
            ++report.mismatchFields;
            break;
        default:
            break;
        }
    }

    if (report.totalFields > 0)
    {
        report.averageConfidence = roundScore(total_score / static_cast<double>(report.totalFields));
    }

    return report;
}

} // namespace verification
