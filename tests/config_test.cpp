#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "interactive_piano/config.hpp"
#include "interactive_piano/logger.hpp"

namespace interactive_piano {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::global()->callbacks.push_back(
            [this](Logger::LogLevel level, std::size_t, const char* message) {
                if (level == Logger::LogLevel::Warning) {
                    warnings.emplace_back(message);
                }
            });
    }
    void TearDown() override { Logger::global()->callbacks.clear(); }

    std::vector<std::string> warnings;
};

TEST_F(ConfigTest, Defaults) {
    InteractivePianoConfig cfg;
    EXPECT_TRUE(cfg.highlighted_notes.empty());
    EXPECT_EQ(cfg.highlight_color, colors::kRed);
    EXPECT_EQ(cfg.natural_color, colors::kWhite);
    EXPECT_EQ(cfg.accidental_color, colors::kBlack);
    EXPECT_FALSE(cfg.animate_highlighted_notes);
    EXPECT_FALSE(cfg.use_alternative_accidentals);
    EXPECT_FALSE(cfg.hide_note_names);
    EXPECT_FALSE(cfg.hide_scrollbar);
    EXPECT_FALSE(cfg.key_width.has_value());
    EXPECT_FALSE(cfg.note_to_scroll_to.has_value());
}

TEST_F(ConfigTest, ValidConfigPassesUnchanged) {
    InteractivePianoConfig cfg;
    cfg.key_width = 40.0;
    InteractivePianoConfig out = cfg.sanitized();
    EXPECT_EQ(out.key_width, 40.0);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(ConfigTest, InvalidKeyWidthFallsBackToAutomatic) {
    InteractivePianoConfig cfg;
    cfg.key_width = -3.0;
    EXPECT_FALSE(cfg.sanitized().key_width.has_value());

    cfg.key_width = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(cfg.sanitized().key_width.has_value());
    EXPECT_EQ(warnings.size(), 2u);
}

TEST_F(ConfigTest, ColoursAreClamped) {
    InteractivePianoConfig cfg;
    cfg.highlight_color = ColorRGBA{2.0f, -1.0f, 0.5f, 1.0f};
    InteractivePianoConfig out = cfg.sanitized();
    EXPECT_EQ(out.highlight_color, (ColorRGBA{1.0f, 0.0f, 0.5f, 1.0f}));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("highlight_color"), std::string::npos);
}

TEST_F(ConfigTest, HighlightMatchesEitherSpelling) {
    InteractivePianoConfig cfg;
    cfg.highlighted_notes = {NotePosition(NoteLetter::C, 4, Accidental::Sharp),
                             NotePosition(NoteLetter::E, 4)};
    EXPECT_TRUE(cfg.is_highlighted(NotePosition(NoteLetter::C, 4, Accidental::Sharp)));
    EXPECT_TRUE(cfg.is_highlighted(NotePosition(NoteLetter::D, 4, Accidental::Flat)));
    EXPECT_TRUE(cfg.is_highlighted(NotePosition(NoteLetter::E, 4)));
    EXPECT_FALSE(cfg.is_highlighted(NotePosition(NoteLetter::E, 5)));
}

TEST(RenderConfigTest, KeyFillColour) {
    KeyboardRenderConfig style;
    ColorRGBA plain = key_fill_color(colors::kWhite, nullptr, false, style);
    EXPECT_EQ(plain, colors::kWhite);

    ColorRGBA highlighted = key_fill_color(colors::kWhite, &colors::kRed, false, style);
    EXPECT_FLOAT_EQ(highlighted.r, 0.98f);
    EXPECT_FLOAT_EQ(highlighted.g, 0.63f);
    EXPECT_FLOAT_EQ(highlighted.b, 0.605f);

    ColorRGBA pressed = key_fill_color(colors::kWhite, nullptr, true, style);
    EXPECT_FLOAT_EQ(pressed.r, 0.75f);

    // Black keys are lifted rather than darkened.
    ColorRGBA pressed_black = key_fill_color(colors::kBlack, nullptr, true, style);
    EXPECT_GT(pressed_black.r, 0.0f);
}

TEST(RenderConfigTest, ColourHelpers) {
    EXPECT_FALSE((ColorRGBA{1.5f, 0.0f, 0.0f}).is_valid());
    EXPECT_TRUE(colors::kRed.is_valid());
    EXPECT_EQ(lerp(colors::kBlack, colors::kWhite, 2.0f), colors::kWhite);
}

}  // namespace
}  // namespace interactive_piano
