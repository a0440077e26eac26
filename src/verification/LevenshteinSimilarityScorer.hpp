#pragma once

#include "ISimilarityScorer.hpp"

#include <cstddef>
#include <string>

namespace verification
{

/**
 * @brief Case-insensitive Levenshtein similarity.
 *
 * This implementation:
 * - Trims ASCII whitespace and lower-cases each codepoint (utf8proc)
 * - Counts unit-cost insertions, deletions and substitutions (rapidfuzz-cpp)
 * - Normalizes as ((maxLen - distance) / maxLen) * 100 over codepoint lengths
 *
 * Two empty values score 0, not 100. Presence is decided by the status
 * classifier before the scorer is ever asked.
 *
 * Example:
 * @code
 * LevenshteinSimilarityScorer scorer;
 * double score = scorer.similarity("Jon Smith", "John Smith"); // 90.0
 * @endcode
 */
class LevenshteinSimilarityScorer : public ISimilarityScorer
{
public:
    double similarity(const std::string& ocr_value, const std::string& user_value) const override;

    /// Unit-cost edit distance between two codepoint sequences
    static std::size_t editDistance(const std::u32string& a, const std::u32string& b);
};

} // namespace verification
