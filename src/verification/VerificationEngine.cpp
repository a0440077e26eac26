#include "VerificationEngine.hpp"
#include "ConfidenceCombiner.hpp"
#include "Diagnostics.hpp"
#include "LevenshteinSimilarityScorer.hpp"
#include "ReportAggregator.hpp"
#include "StatusClassifier.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>

namespace verification
{

VerificationEngine::VerificationEngine(EngineOptions options)
    : VerificationEngine(std::make_unique<LevenshteinSimilarityScorer>(), options)
{
}

VerificationEngine::VerificationEngine(std::unique_ptr<ISimilarityScorer> scorer, EngineOptions options)
    : scorer_(std::move(scorer))
    , options_(options)
{
    if (!scorer_)
    {
        scorer_ = std::make_unique<LevenshteinSimilarityScorer>();
    }
}

VerificationEngine::~VerificationEngine() = default;

VerificationReport VerificationEngine::verify(const nlohmann::json& ocr_data, const nlohmann::json& user_data) const
{
    PROFILE_SCOPE_FUNCTION();

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[VerificationEngine] OCR data: " << Diagnostics::PreviewJson(ocr_data);
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[VerificationEngine] User data: " << Diagnostics::PreviewJson(user_data);
    }

    std::vector<ReconciledField> fields = reconciler_.reconcile(ocr_data, user_data);
    std::vector<VerificationOutcome> outcomes = evaluateAll(fields);

    VerificationReport report;
    {
        PROFILE_SCOPE_CUSTOM("VerificationEngine::aggregate");
        report = aggregateReport(std::move(outcomes));
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[VerificationEngine] Verified " << report.totalFields << " fields: "
                                          << report.matchedFields << " match, " << report.partialMatchFields
                                          << " partial, " << report.mismatchFields << " mismatch, average "
                                          << report.averageConfidence;
    return report;
}

VerificationOutcome VerificationEngine::evaluate(const ReconciledField& field) const
{
    VerificationOutcome outcome;
    outcome.field = field.key;
    outcome.ocrValue = trim(field.ocrValue);
    outcome.userValue = trim(field.userValue);
    outcome.ocrConfidence = field.ocrConfidence;

    const PresenceCase presence = classifyPresence(outcome.ocrValue, outcome.userValue);
    if (presence != PresenceCase::BothPresent)
    {
        outcome.status = statusForPresence(presence);
        outcome.notes = notesFor(outcome.status);
        return outcome;
    }

    const double similarity = std::clamp(scorer_->similarity(outcome.ocrValue, outcome.userValue), 0.0, 100.0);

    // Combine the reported two-decimal similarity; thresholds apply to the reported combined score
    outcome.similarity = roundScore(similarity);
    outcome.combinedScore = roundScore(combineConfidence(outcome.similarity, field.ocrConfidence));
    outcome.status = classifyScore(outcome.combinedScore);
    outcome.notes = notesFor(outcome.status);

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[VerificationEngine] '" << field.key << "' sim=" << outcome.similarity
                                               << " conf=" << outcome.ocrConfidence << " combined="
                                               << outcome.combinedScore << " -> " << toString(outcome.status);
    }
    return outcome;
}

std::vector<VerificationOutcome> VerificationEngine::evaluateAll(const std::vector<ReconciledField>& fields) const
{
    PROFILE_SCOPE_CUSTOM("VerificationEngine::evaluate");

    std::vector<VerificationOutcome> outcomes(fields.size());
    const std::size_t workers = workerCount(fields.size());

    if (workers <= 1)
    {
        for (std::size_t i = 0; i < fields.size(); ++i)
        {
            outcomes[i] = evaluate(fields[i]);
        }
        return outcomes;
    }

    // Contiguous index ranges, each worker writes only its own slots
    const std::size_t chunk = (fields.size() + workers - 1) / workers;
    std::vector<std::exception_ptr> errors(workers);
    std::size_t inline_begin = fields.size();
    {
        std::vector<std::jthread> threads;
        threads.reserve(workers);

        for (std::size_t w = 0; w < workers; ++w)
        {
            const std::size_t begin = w * chunk;
            const std::size_t end = std::min(fields.size(), begin + chunk);
            if (begin >= end)
                break;

            try
            {
                threads.emplace_back(
                    [this, &fields, &outcomes, &errors, w, begin, end]()
                    {
                        try
                        {
                            for (std::size_t i = begin; i < end; ++i)
                            {
                                outcomes[i] = evaluate(fields[i]);
                            }
                        }
                        catch (...)
                        {
                            errors[w] = std::current_exception();
                        }
                    });
            }
            catch (const std::system_error& ex)
            {
                PLOG_WARNING_(Diagnostics::kLogInstance) << "[VerificationEngine] Could not start worker " << w
                                                         << " (" << ex.what() << "), scoring the rest inline";
                inline_begin = begin;
                break;
            }
        }

        // Remaining ranges run here; jthread joins the started workers on every exit path
        for (std::size_t i = inline_begin; i < fields.size(); ++i)
        {
            outcomes[i] = evaluate(fields[i]);
        }
    }

    for (const auto& error : errors)
    {
        if (error)
            std::rethrow_exception(error);
    }

    return outcomes;
}

std::size_t VerificationEngine::workerCount(std::size_t field_count) const
{
    if (!options_.parallel || field_count < std::max<std::size_t>(options_.parallel_min_fields, 2))
        return 1;

    std::size_t limit = options_.max_workers;
    if (limit == 0)
    {
        limit = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::min(limit, field_count);
}

} // namespace verification
