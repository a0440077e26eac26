#include "ConfidenceCombiner.hpp"

#include <algorithm>

namespace verification
{

double combineConfidence(double similarity, double ocr_confidence) noexcept
{
    if (ocr_confidence > 0.0)
    {
        double combined = kSimilarityWeight * similarity + kOcrConfidenceWeight * ocr_confidence;
        return std::clamp(combined, 0.0, 100.0);
    }
    return similarity;
}

} // namespace verification
