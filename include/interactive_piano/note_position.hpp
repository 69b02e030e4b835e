#pragma once

#include "interactive_piano/types.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace interactive_piano {

enum class NoteLetter {
    C,
    D,
    E,
    F,
    G,
    A,
    B,
};

enum class Accidental {
    None,
    Sharp,
    Flat,
};

// Identifies a single key on the keyboard by spelling: letter, octave and
// accidental. Octaves follow the MIDI convention where C4 is key 60.
//
// Two positions are the same key only if all three fields match; a note and
// its enharmonic alternative (C#4 / Db4) share a MIDI key but are not equal.
struct NotePosition {
    NoteLetter letter{NoteLetter::C};
    Octave octave{4};
    Accidental accidental{Accidental::None};

    NotePosition() = default;

    NotePosition(NoteLetter letter_value,
                 Octave octave_value = 4,
                 Accidental accidental_value = Accidental::None)
        : letter(letter_value),
          octave(octave_value),
          accidental(accidental_value) {
        validate();
    }

    bool is_natural() const noexcept {
        return accidental == Accidental::None;
    }

    MidiKey midi_key() const noexcept;

    // Display name such as "C4", "C♯4" or "B♭3" (UTF-8 accidental signs).
    std::string name() const;

    // Same physical key spelled with the opposite accidental (C♯4 <-> D♭4).
    // Empty for naturals and for E♯/B♯/F♭/C♭, whose enharmonic is a natural.
    std::optional<NotePosition> alternative_accidental() const;

    // Same letter and octave with the accidental removed.
    NotePosition natural() const noexcept {
        NotePosition n = *this;
        n.accidental = Accidental::None;
        return n;
    }

    static NotePosition middle_c() noexcept {
        return NotePosition{};
    }

    // Black keys are spelled as sharps unless `preferred` is Accidental::Flat.
    // Throws std::invalid_argument for keys outside 0-127.
    static NotePosition from_midi_key(MidiKey key,
                                      Accidental preferred = Accidental::Sharp);

    // Inverse of name(). Also accepts ASCII '#' and 'b' for the accidental.
    static std::optional<NotePosition> parse(std::string_view text);

private:
    void validate() const;
};

bool operator==(const NotePosition& a, const NotePosition& b) noexcept;
bool operator!=(const NotePosition& a, const NotePosition& b) noexcept;

// Orders by MIDI key, then by letter, so enharmonic spellings sit next to
// each other (C♯4 before D♭4).
bool operator<(const NotePosition& a, const NotePosition& b) noexcept;
bool operator>(const NotePosition& a, const NotePosition& b) noexcept;
bool operator<=(const NotePosition& a, const NotePosition& b) noexcept;
bool operator>=(const NotePosition& a, const NotePosition& b) noexcept;

std::ostream& operator<<(std::ostream& out, const NotePosition& note);

const char* to_string(NoteLetter letter) noexcept;

}  // namespace interactive_piano
