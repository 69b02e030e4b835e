#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "interactive_piano/keyboard.hpp"

namespace interactive_piano {
namespace {

TEST(ApplyShiftTest, UsLayout) {
    EXPECT_EQ(apply_shift('q', false), 'q');
    EXPECT_EQ(apply_shift('q', true), 'Q');
    EXPECT_EQ(apply_shift('1', true), '!');
    EXPECT_EQ(apply_shift('2', true), '@');
    EXPECT_EQ(apply_shift('3', true), '#');
    EXPECT_EQ(apply_shift('Q', true), 'Q');
    EXPECT_EQ(apply_shift('-', true), '-');
}

class KeyboardControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        keys.set_note_tapped_callback(
            [this](const std::string& name) { tapped.push_back(name); });
    }

    KeyStateMachine keys;
    KeyboardController controller{keys};
    std::vector<std::string> tapped;
};

TEST_F(KeyboardControllerTest, KeyDownPressesMappedNote) {
    EXPECT_TRUE(controller.on_key_event('g', KeyAction::Down));
    EXPECT_EQ(tapped, std::vector<std::string>{"F4"});
    EXPECT_TRUE(keys.is_pressed(NotePosition(NoteLetter::F, 4)));
    EXPECT_EQ(keys.pressed_source(NotePosition(NoteLetter::F, 4)), InputSource::Physical);
}

TEST_F(KeyboardControllerTest, RepeatIsAbsorbed) {
    controller.on_key_event('g', KeyAction::Down);
    controller.on_key_event('g', KeyAction::Repeat);
    controller.on_key_event('g', KeyAction::Repeat);
    EXPECT_EQ(tapped.size(), 1u);
}

TEST_F(KeyboardControllerTest, KeyUpReleases) {
    controller.on_key_event('g', KeyAction::Down);
    EXPECT_TRUE(controller.on_key_event('g', KeyAction::Up));
    EXPECT_FALSE(keys.is_pressed(NotePosition(NoteLetter::F, 4)));

    controller.on_key_event('g', KeyAction::Down);
    EXPECT_EQ(tapped.size(), 2u);
}

TEST_F(KeyboardControllerTest, UnmappedLabelIgnored) {
    EXPECT_FALSE(controller.on_key_event('4', KeyAction::Down));
    EXPECT_FALSE(controller.on_key_event('4', KeyAction::Up));
    EXPECT_TRUE(tapped.empty());
}

TEST_F(KeyboardControllerTest, ShiftedKeyPlaysSharp) {
    controller.on_key_event(apply_shift('g', true), KeyAction::Down);
    EXPECT_EQ(tapped, std::vector<std::string>{"F♯4"});
}

TEST_F(KeyboardControllerTest, AlternativeSpelling) {
    controller.set_use_alternative_accidentals(true);
    EXPECT_TRUE(controller.use_alternative_accidentals());
    EXPECT_EQ(controller.resolve('G'), NotePosition(NoteLetter::G, 4, Accidental::Flat));
    EXPECT_EQ(controller.resolve('g'), NotePosition(NoteLetter::F, 4));

    controller.on_key_event('G', KeyAction::Down);
    EXPECT_EQ(tapped, std::vector<std::string>{"G♭4"});
    controller.on_key_event('G', KeyAction::Up);
    EXPECT_EQ(keys.pressed_count(), 0u);
}

}  // namespace
}  // namespace interactive_piano
