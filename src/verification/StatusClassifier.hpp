#pragma once

#include "VerificationTypes.hpp"

#include <string>

namespace verification
{

inline constexpr double kMatchThreshold = 95.0;
inline constexpr double kPartialMatchThreshold = 75.0;

inline constexpr const char* kNotesNotProvided = "No value provided by either OCR or user";
inline constexpr const char* kNotesUserAdded = "Value provided by user but not detected by OCR";
inline constexpr const char* kNotesOcrPresent = "OCR found a value but user left the field empty";
inline constexpr const char* kNotesMismatch = "Values differ significantly; please verify the correct value";

// Which sides carry a value after trimming, in classifier priority order
enum class PresenceCase
{
    BothEmpty,
    UserOnly,
    OcrOnly,
    BothPresent
};

[[nodiscard]] PresenceCase classifyPresence(const std::string& trimmed_ocr, const std::string& trimmed_user) noexcept;

/// Status for a one-sided or empty field. BothPresent has no fixed status.
[[nodiscard]] FieldStatus statusForPresence(PresenceCase presence) noexcept;

/// Status for a field where both sides are present
[[nodiscard]] FieldStatus classifyScore(double combined_score) noexcept;

[[nodiscard]] std::string notesFor(FieldStatus status);

} // namespace verification
