#pragma once

#include "interactive_piano/note_position.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace interactive_piano {

// One row of the computer-keyboard layout: the note a key plays and the
// character the key produces. Naturals sit on the unshifted keys, sharps on
// the shifted variant of the key for the natural below them.
struct PhysicalKeyBinding {
    std::string_view note_name;
    char label;
};

inline constexpr std::size_t kPhysicalKeyCount = 49;

// Fixed note-to-key table covering C2 to C6 (sharps up to A♯5). Notes outside
// it cannot be played from the computer keyboard; pointer input still works.
const std::array<PhysicalKeyBinding, kPhysicalKeyCount>& physical_key_bindings() noexcept;

// Label for a display name such as "F4" or "C♯4". Case of the note name must
// match the table exactly.
std::optional<char> label_for_note(std::string_view note_name) noexcept;

// Label for a position. Flat spellings resolve through their sharp
// alternative, so D♭4 shares the key of C♯4.
std::optional<char> label_for_note(const NotePosition& note);

// Reverse lookup; case-sensitive ('q' is F2, 'Q' is F♯2).
std::optional<std::string_view> note_for_label(char label) noexcept;

std::optional<NotePosition> note_position_for_label(char label);

}  // namespace interactive_piano
