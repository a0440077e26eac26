#pragma once

#include "FieldReconciler.hpp"
#include "ISimilarityScorer.hpp"
#include "VerificationTypes.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace verification
{

struct EngineOptions
{
    bool parallel = true;
    std::size_t max_workers = 4;          // 0 = hardware concurrency
    std::size_t parallel_min_fields = 32; // below this, fields are scored inline
};

/**
 * @brief Runs a full verification: reconcile, score each field, aggregate.
 *
 * Stateless between calls; one engine may serve concurrent requests. Parallel
 * and serial runs produce identical reports.
 */
class VerificationEngine
{
public:
    explicit VerificationEngine(EngineOptions options = {});
    VerificationEngine(std::unique_ptr<ISimilarityScorer> scorer, EngineOptions options);
    ~VerificationEngine();

    VerificationEngine(const VerificationEngine&) = delete;
    VerificationEngine& operator=(const VerificationEngine&) = delete;

    /**
     * @throws InvalidInputError when neither input carries data
     */
    [[nodiscard]] VerificationReport verify(const nlohmann::json& ocr_data, const nlohmann::json& user_data) const;

    /// Per-field pipeline: presence check, then scorer and combiner when both sides are set
    [[nodiscard]] VerificationOutcome evaluate(const ReconciledField& field) const;

private:
    std::vector<VerificationOutcome> evaluateAll(const std::vector<ReconciledField>& fields) const;
    std::size_t workerCount(std::size_t field_count) const;

    std::unique_ptr<ISimilarityScorer> scorer_;
    FieldReconciler reconciler_;
    EngineOptions options_;
};

} // namespace verification
