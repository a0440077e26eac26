#include <catch2/catch_test_macros.hpp>
#include "verification/StatusClassifier.hpp"

using namespace verification;

TEST_CASE("StatusClassifier - Presence", "[classifier]")
{
    REQUIRE(classifyPresence("", "") == PresenceCase::BothEmpty);
    REQUIRE(classifyPresence("", "a@b.com") == PresenceCase::UserOnly);
    REQUIRE(classifyPresence("Pune", "") == PresenceCase::OcrOnly);
    REQUIRE(classifyPresence("Pune", "pune") == PresenceCase::BothPresent);

    REQUIRE(statusForPresence(PresenceCase::BothEmpty) == FieldStatus::NotProvided);
    REQUIRE(statusForPresence(PresenceCase::UserOnly) == FieldStatus::UserAdded);
    REQUIRE(statusForPresence(PresenceCase::OcrOnly) == FieldStatus::OcrPresent);
}

TEST_CASE("StatusClassifier - Score thresholds", "[classifier][boundary]")
{
    SECTION("Match threshold is inclusive")
    {
        REQUIRE(classifyScore(kMatchThreshold) == FieldStatus::Match);
        REQUIRE(classifyScore(100.0) == FieldStatus::Match);
        REQUIRE(classifyScore(94.99) == FieldStatus::PartialMatch);
    }

    SECTION("Partial match threshold is inclusive")
    {
        REQUIRE(classifyScore(kPartialMatchThreshold) == FieldStatus::PartialMatch);
        REQUIRE(classifyScore(74.99) == FieldStatus::Mismatch);
    }

    SECTION("Zero is a mismatch")
    {
        REQUIRE(classifyScore(0.0) == FieldStatus::Mismatch);
    }
}

TEST_CASE("StatusClassifier - Notes", "[classifier]")
{
    REQUIRE(notesFor(FieldStatus::Match).empty());
    REQUIRE(notesFor(FieldStatus::PartialMatch).empty());
    REQUIRE(notesFor(FieldStatus::Mismatch) == kNotesMismatch);
    REQUIRE(notesFor(FieldStatus::NotProvided) == kNotesNotProvided);
    REQUIRE(notesFor(FieldStatus::UserAdded) == kNotesUserAdded);
    REQUIRE(notesFor(FieldStatus::OcrPresent) == kNotesOcrPresent);
}

TEST_CASE("StatusClassifier - Wire names", "[classifier]")
{
    REQUIRE(std::string(toString(FieldStatus::Match)) == "Match");
    REQUIRE(std::string(toString(FieldStatus::PartialMatch)) == "PartialMatch");
    REQUIRE(std::string(toString(FieldStatus::Mismatch)) == "Mismatch");
    REQUIRE(std::string(toString(FieldStatus::NotProvided)) == "NotProvided");
    REQUIRE(std::string(toString(FieldStatus::UserAdded)) == "UserAdded");
    REQUIRE(std::string(toString(FieldStatus::OcrPresent)) == "OcrPresent");
}
