#include "StatusClassifier.hpp"

namespace verification
{

PresenceCase classifyPresence(const std::string& trimmed_ocr, const std::string& trimmed_user) noexcept
{
    if (trimmed_user.empty() && trimmed_ocr.empty())
        return PresenceCase::BothEmpty;
    if (trimmed_ocr.empty())
        return PresenceCase::UserOnly;
    if (trimmed_user.empty())
        return PresenceCase::OcrOnly;
    return PresenceCase::BothPresent;
}

FieldStatus statusForPresence(PresenceCase presence) noexcept
{
    switch (presence)
    {
    case PresenceCase::BothEmpty:
        return FieldStatus::NotProvided;
    case PresenceCase::UserOnly:
        return FieldStatus::UserAdded;
    case PresenceCase::OcrOnly:
        return FieldStatus::OcrPresent;
    case PresenceCase::BothPresent:
    default:
        return FieldStatus::Mismatch;
    }
}

FieldStatus classifyScore(double combined_score) noexcept
{
    if (combined_score >= kMatchThreshold)
        return FieldStatus::Match;
    if (combined_score >= kPartialMatchThreshold)
        return FieldStatus::PartialMatch;
    return FieldStatus::Mismatch;
}

std::string notesFor(FieldStatus status)
{
    switch (status)
    {
    case FieldStatus::NotProvided:
        return kNotesNotProvided;
    case FieldStatus::UserAdded:
        return kNotesUserAdded;
    case FieldStatus::OcrPresent:
        return kNotesOcrPresent;
    case FieldStatus::Mismatch:
        return kNotesMismatch;
    default:
        return {};
    }
}

} // namespace verification
