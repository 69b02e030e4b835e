#include <gtest/gtest.h>

#include "interactive_piano/renderer.hpp"
#include "interactive_piano/widget.hpp"

namespace interactive_piano {
namespace {

const KeyRect& key_for(const InteractivePiano& piano, const NotePosition& note) {
    for (const KeyRect& key : piano.key_layout()) {
        if (key.note == note) {
            return key;
        }
    }
    ADD_FAILURE() << "no key for " << note;
    return piano.key_layout().front();
}

TEST(KeyboardRendererTest, MiddleCCarriesMarkerAndLabels) {
    InteractivePianoConfig cfg;
    cfg.key_width = 35.0;
    InteractivePiano piano(
        NoteRange(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5)), cfg);
    piano.layout(200.0, 100.0);

    KeyVisual v = piano.renderer().describe(
        piano, key_for(piano, NotePosition::middle_c()));
    EXPECT_TRUE(v.middle_c_marker);
    EXPECT_TRUE(v.show_text);
    EXPECT_EQ(v.label, "s");
    EXPECT_EQ(v.note_name, "C4");
    EXPECT_EQ(v.fill, colors::kWhite);
    EXPECT_EQ(v.text_color, colors::kWhite);
    EXPECT_FLOAT_EQ(v.font_size, 10.0f);
    EXPECT_FLOAT_EQ(v.corner_radius, 7.0f);
}

TEST(KeyboardRendererTest, AccidentalsUseLightText) {
    InteractivePianoConfig cfg;
    cfg.key_width = 40.0;
    InteractivePiano piano(
        NoteRange(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5)), cfg);
    piano.layout(200.0, 100.0);

    KeyVisual v = piano.renderer().describe(
        piano, key_for(piano, NotePosition(NoteLetter::F, 4, Accidental::Sharp)));
    EXPECT_FALSE(v.middle_c_marker);
    EXPECT_EQ(v.label, "G");
    EXPECT_EQ(v.fill, colors::kBlack);
    EXPECT_EQ(v.text_color, piano.renderer().config().accidental_text_color);

    KeyVisual natural = piano.renderer().describe(
        piano, key_for(piano, NotePosition(NoteLetter::D, 4)));
    EXPECT_EQ(natural.text_color, piano.renderer().config().natural_text_color);
}

TEST(KeyboardRendererTest, HighlightAndPressBlend) {
    InteractivePianoConfig cfg;
    cfg.key_width = 40.0;
    cfg.highlighted_notes = {NotePosition(NoteLetter::E, 4)};
    InteractivePiano piano(
        NoteRange(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5)), cfg);
    piano.layout(200.0, 100.0);
    const KeyboardRenderConfig& style = piano.renderer().config();

    KeyVisual e4 = piano.renderer().describe(piano, key_for(piano, NotePosition(NoteLetter::E, 4)));
    EXPECT_TRUE(e4.highlighted);
    EXPECT_EQ(e4.fill, key_fill_color(colors::kWhite, &colors::kRed, false, style));

    piano.tap(NotePosition(NoteLetter::D, 4));
    KeyVisual d4 = piano.renderer().describe(piano, key_for(piano, NotePosition(NoteLetter::D, 4)));
    EXPECT_TRUE(d4.pressed);
    EXPECT_EQ(d4.fill, key_fill_color(colors::kWhite, nullptr, true, style));
}

TEST(KeyboardRendererTest, HiddenNamesSuppressText) {
    InteractivePianoConfig cfg;
    cfg.key_width = 40.0;
    cfg.hide_note_names = true;
    InteractivePiano piano(
        NoteRange(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5)), cfg);
    piano.layout(200.0, 100.0);
    KeyVisual v = piano.renderer().describe(piano, key_for(piano, NotePosition::middle_c()));
    EXPECT_FALSE(v.show_text);
    EXPECT_TRUE(v.middle_c_marker);
}

TEST(KeyboardRendererTest, ScrollbarThumbTracksOffset) {
    InteractivePianoConfig cfg;
    cfg.key_width = 40.0;
    InteractivePiano piano(
        NoteRange(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5)), cfg);
    piano.layout(300.0, 100.0);

    ScrollbarThumb start = piano.renderer().scrollbar_thumb(piano, 300.0f);
    EXPECT_FLOAT_EQ(start.width, 281.25f);
    EXPECT_FLOAT_EQ(start.offset, 0.0f);

    piano.user_scroll(20.0);
    ScrollbarThumb end = piano.renderer().scrollbar_thumb(piano, 300.0f);
    EXPECT_FLOAT_EQ(end.offset, 18.75f);
}

TEST(KeyboardRendererTest, ThumbFillsTrackWhenEverythingFits) {
    InteractivePiano piano(
        NoteRange(NotePosition(NoteLetter::C, 4), NotePosition(NoteLetter::C, 5)));
    piano.layout(302.0, 100.0);
    ScrollbarThumb thumb = piano.renderer().scrollbar_thumb(piano, 120.0f);
    EXPECT_FLOAT_EQ(thumb.offset, 0.0f);
    EXPECT_FLOAT_EQ(thumb.width, 120.0f);
}

}  // namespace
}  // namespace interactive_piano
