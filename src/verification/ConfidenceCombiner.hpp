#pragma once

namespace verification
{

// Content agreement outweighs the extractor's self-reported confidence
inline constexpr double kSimilarityWeight = 0.55;
inline constexpr double kOcrConfidenceWeight = 0.45;

/// Blends similarity with OCR confidence. Without a positive confidence the
/// similarity is returned unchanged. Only meaningful when both values are present.
[[nodiscard]] double combineConfidence(double similarity, double ocr_confidence) noexcept;

} // namespace verification
