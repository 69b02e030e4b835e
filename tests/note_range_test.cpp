#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "interactive_piano/note_range.hpp"

namespace interactive_piano {
namespace {

std::vector<std::string> names(const std::vector<NotePosition>& positions) {
    std::vector<std::string> out;
    for (const auto& p : positions) {
        out.push_back(p.name());
    }
    return out;
}

TEST(NoteRangeTest, DescendingRangeThrows) {
    EXPECT_THROW(NoteRange(NotePosition(NoteLetter::D, 4), NotePosition(NoteLetter::C, 4)),
                 std::invalid_argument);
}

TEST(NoteRangeTest, SingleNoteRange) {
    NoteRange r(NotePosition::middle_c(), NotePosition::middle_c());
    EXPECT_EQ(r.size(), 1u);
    EXPECT_EQ(names(r.all_positions()), std::vector<std::string>{"C4"});
}

TEST(NoteRangeTest, AllPositionsUseSharps) {
    NoteRange r(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::E, 4));
    EXPECT_EQ(names(r.all_positions()),
              (std::vector<std::string>{"C4", "C♯4", "D4", "D♯4", "E4"}));
    EXPECT_EQ(r.size(), 5u);
}

TEST(NoteRangeTest, EndpointsKeepTheirSpelling) {
    NoteRange r(NotePosition(NoteLetter::D, 4, Accidental::Flat),
                NotePosition(NoteLetter::E, 4, Accidental::Flat));
    EXPECT_EQ(names(r.all_positions()),
              (std::vector<std::string>{"D♭4", "D4", "E♭4"}));
}

TEST(NoteRangeTest, OctaveHasSevenNaturals) {
    NoteRange r(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::B, 4));
    EXPECT_EQ(r.size(), 12u);
    EXPECT_EQ(r.natural_positions().size(), 7u);
}

TEST(NoteRangeTest, ContainsComparesMidiKeys) {
    NoteRange r(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5));
    EXPECT_TRUE(r.contains(NotePosition(NoteLetter::D, 4, Accidental::Flat)));
    EXPECT_TRUE(r.contains(NotePosition(NoteLetter::C, 5)));
    EXPECT_FALSE(r.contains(NotePosition(NoteLetter::B, 3)));
    EXPECT_FALSE(r.contains(NotePosition(NoteLetter::C, 5, Accidental::Sharp)));
}

TEST(NoteRangeTest, ClefPresets) {
    NoteRange treble = NoteRange::for_clefs({Clef::Treble});
    EXPECT_EQ(treble.from(), NotePosition(NoteLetter::E, 4));
    EXPECT_EQ(treble.to(), NotePosition(NoteLetter::F, 5));

    NoteRange bass = NoteRange::for_clefs({Clef::Bass});
    EXPECT_EQ(bass.from(), NotePosition(NoteLetter::G, 2));
    EXPECT_EQ(bass.to(), NotePosition(NoteLetter::A, 3));

    NoteRange alto = NoteRange::for_clefs({Clef::Alto}, /*extended=*/true);
    EXPECT_EQ(alto.from(), NotePosition(NoteLetter::B, 2));
    EXPECT_EQ(alto.to(), NotePosition(NoteLetter::D, 5));
}

TEST(NoteRangeTest, ClefUnionSpansAll) {
    NoteRange r = NoteRange::for_clefs({Clef::Treble, Clef::Bass}, /*extended=*/true);
    EXPECT_EQ(r.from(), NotePosition(NoteLetter::C, 2));
    EXPECT_EQ(r.to(), NotePosition(NoteLetter::C, 6));
}

TEST(NoteRangeTest, EmptyClefListThrows) {
    EXPECT_THROW(NoteRange::for_clefs({}), std::invalid_argument);
}

TEST(NoteRangeTest, Equality) {
    NoteRange a(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5));
    NoteRange b(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5));
    NoteRange c(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::D, 5));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

}  // namespace
}  // namespace interactive_piano
