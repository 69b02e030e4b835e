#pragma once

#include "interactive_piano/key_state.hpp"
#include "interactive_piano/physical_key_map.hpp"

#include <optional>

namespace interactive_piano {

// Kind of a raw computer-keyboard event. The host is responsible for turning
// framework-specific key codes (e.g. ImGui, GLFW) into the character label
// the key produces, including shift.
enum class KeyAction {
    Down,
    Repeat,
    Up,
};

// Character produced by a key whose unshifted character is `base`, e.g.
// 'q' -> 'Q' and '1' -> '!'. Only the US layout rows used by the physical
// key table are covered; other characters are returned unchanged.
char apply_shift(char base, bool shift) noexcept;

// Feeds computer-keyboard events into the press state machine through the
// physical key table:
// - Down / Repeat: press the mapped note (repeats are absorbed as duplicate
//   presses).
// - Up: release the mapped note.
// Labels without a table entry are not consumed.
class KeyboardController {
public:
    explicit KeyboardController(KeyStateMachine& keys);

    // Handle a key event. Returns true if the label maps to a note.
    bool on_key_event(char label, KeyAction action);

    // Note a label plays, respelled with the alternative accidental when
    // that preference is enabled.
    std::optional<NotePosition> resolve(char label) const;

    void set_use_alternative_accidentals(bool enabled) noexcept {
        use_alternative_accidentals_ = enabled;
    }
    bool use_alternative_accidentals() const noexcept {
        return use_alternative_accidentals_;
    }

private:
    KeyStateMachine* keys_{nullptr};
    bool use_alternative_accidentals_{false};
};

}  // namespace interactive_piano
