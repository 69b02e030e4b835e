#include <gtest/gtest.h>

#include <set>
#include <string>

#include "interactive_piano/physical_key_map.hpp"

namespace interactive_piano {
namespace {

TEST(PhysicalKeyMapTest, TableHasUniqueEntries) {
    const auto& bindings = physical_key_bindings();
    EXPECT_EQ(bindings.size(), 49u);

    std::set<std::string_view> notes;
    std::set<char> labels;
    for (const auto& b : bindings) {
        notes.insert(b.note_name);
        labels.insert(b.label);
    }
    EXPECT_EQ(notes.size(), bindings.size());
    EXPECT_EQ(labels.size(), bindings.size());
}

TEST(PhysicalKeyMapTest, EveryEntryRoundTrips) {
    for (const auto& b : physical_key_bindings()) {
        EXPECT_EQ(label_for_note(b.note_name), b.label) << b.note_name;
        EXPECT_EQ(note_for_label(b.label), b.note_name) << b.label;
        auto position = note_position_for_label(b.label);
        ASSERT_TRUE(position.has_value()) << b.label;
        EXPECT_EQ(position->name(), b.note_name);
    }
}

TEST(PhysicalKeyMapTest, KnownBindings) {
    EXPECT_EQ(label_for_note("C2"), '1');
    EXPECT_EQ(label_for_note("C4"), 's');
    EXPECT_EQ(label_for_note("F4"), 'g');
    EXPECT_EQ(label_for_note("C6"), 'm');
    EXPECT_EQ(label_for_note("C♯2"), '!');
    EXPECT_EQ(label_for_note("A♯5"), 'B');
}

TEST(PhysicalKeyMapTest, LabelsAreCaseSensitive) {
    EXPECT_EQ(note_for_label('q'), std::string_view("F2"));
    EXPECT_EQ(note_for_label('Q'), std::string_view("F♯2"));
    EXPECT_EQ(note_for_label('s'), std::string_view("C4"));
    EXPECT_EQ(note_for_label('S'), std::string_view("C♯4"));
}

TEST(PhysicalKeyMapTest, UnmappedLookups) {
    EXPECT_FALSE(note_for_label('4'));
    EXPECT_FALSE(note_for_label(' '));
    EXPECT_FALSE(note_for_label('N'));  // no sharp above B5
    EXPECT_FALSE(label_for_note("C7"));
    EXPECT_FALSE(label_for_note("c4"));
    EXPECT_FALSE(label_for_note("C#4"));  // ASCII sharp is not a display name
    EXPECT_FALSE(label_for_note(NotePosition(NoteLetter::C, 1)));
}

TEST(PhysicalKeyMapTest, FlatsShareTheirSharpKey) {
    EXPECT_EQ(label_for_note(NotePosition(NoteLetter::D, 4, Accidental::Flat)), 'S');
    EXPECT_EQ(label_for_note(NotePosition(NoteLetter::B, 2, Accidental::Flat)), 'E');
    EXPECT_FALSE(label_for_note("D♭4"));
}

}  // namespace
}  // namespace interactive_piano
