#include "LevenshteinSimilarityScorer.hpp"
#include "TextUtils.hpp"

#include <rapidfuzz/distance/Levenshtein.hpp>
#include <algorithm>

namespace verification
{

double LevenshteinSimilarityScorer::similarity(const std::string& ocr_value, const std::string& user_value) const
{
    const std::u32string lhs = comparisonForm(ocr_value);
    const std::u32string rhs = comparisonForm(user_value);

    const std::size_t max_len = std::max(lhs.size(), rhs.size());
    if (max_len == 0)
    {
        return 0.0;
    }

    const std::size_t distance = editDistance(lhs, rhs);
    return (static_cast<double>(max_len - distance) / static_cast<double>(max_len)) * 100.0;
}

std::size_t LevenshteinSimilarityScorer::editDistance(const std::u32string& a, const std::u32string& b)
{
    // Default weights {1, 1, 1}: plain Levenshtein, substitution counts once
    return static_cast<std::size_t>(rapidfuzz::levenshtein_distance(a, b));
}

} // namespace verification
