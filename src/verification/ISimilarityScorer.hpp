#pragma once

#include <string>

namespace verification
{

/**
 * @brief Abstract interface for field value similarity scoring.
 *
 * Scores are percentages in [0.0, 100.0]. Implementations decide how values are
 * normalized before comparison; callers pass the raw (untrimmed) field values.
 */
class ISimilarityScorer
{
public:
    virtual ~ISimilarityScorer() = default;

    /**
     * @brief Calculate similarity between two field values.
     *
     * @param ocr_value Value extracted by the OCR stage
     * @param user_value Value entered or corrected by the reviewer
     * @return Similarity percentage in [0.0, 100.0]
     */
    virtual double similarity(const std::string& ocr_value, const std::string& user_value) const = 0;
};

} // namespace verification
