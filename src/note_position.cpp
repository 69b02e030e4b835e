#include "interactive_piano/note_position.hpp"

#include <charconv>
#include <ostream>
#include <stdexcept>

namespace interactive_piano {

namespace {

constexpr std::string_view kSharpSign = "♯";
constexpr std::string_view kFlatSign = "♭";

int semitone_of(NoteLetter letter) noexcept {
    switch (letter) {
    case NoteLetter::C:
        return 0;
    case NoteLetter::D:
        return 2;
    case NoteLetter::E:
        return 4;
    case NoteLetter::F:
        return 5;
    case NoteLetter::G:
        return 7;
    case NoteLetter::A:
        return 9;
    case NoteLetter::B:
        return 11;
    }
    return 0;
}

int accidental_offset(Accidental accidental) noexcept {
    switch (accidental) {
    case Accidental::Sharp:
        return 1;
    case Accidental::Flat:
        return -1;
    case Accidental::None:
        break;
    }
    return 0;
}

MidiKey compute_midi_key(NoteLetter letter,
                         Octave octave,
                         Accidental accidental) noexcept {
    return (octave + 1) * 12 + semitone_of(letter) +
           accidental_offset(accidental);
}

NoteLetter next_letter(NoteLetter letter) noexcept {
    return letter == NoteLetter::B
               ? NoteLetter::C
               : static_cast<NoteLetter>(static_cast<int>(letter) + 1);
}

NoteLetter previous_letter(NoteLetter letter) noexcept {
    return letter == NoteLetter::C
               ? NoteLetter::B
               : static_cast<NoteLetter>(static_cast<int>(letter) - 1);
}

std::optional<NoteLetter> letter_from_char(char c) noexcept {
    switch (c) {
    case 'C':
        return NoteLetter::C;
    case 'D':
        return NoteLetter::D;
    case 'E':
        return NoteLetter::E;
    case 'F':
        return NoteLetter::F;
    case 'G':
        return NoteLetter::G;
    case 'A':
        return NoteLetter::A;
    case 'B':
        return NoteLetter::B;
    default:
        return std::nullopt;
    }
}

}  // namespace

void NotePosition::validate() const {
    MidiKey key = compute_midi_key(letter, octave, accidental);
    if (key < 0 || key > 127) {
        throw std::invalid_argument("Note position must map to MIDI key 0-127");
    }
}

MidiKey NotePosition::midi_key() const noexcept {
    return compute_midi_key(letter, octave, accidental);
}

std::string NotePosition::name() const {
    std::string out = to_string(letter);
    if (accidental == Accidental::Sharp) {
        out += kSharpSign;
    } else if (accidental == Accidental::Flat) {
        out += kFlatSign;
    }
    out += std::to_string(octave);
    return out;
}

std::optional<NotePosition> NotePosition::alternative_accidental() const {
    switch (accidental) {
    case Accidental::Sharp:
        if (letter == NoteLetter::E || letter == NoteLetter::B) {
            return std::nullopt;
        }
        return NotePosition{next_letter(letter), octave, Accidental::Flat};
    case Accidental::Flat:
        if (letter == NoteLetter::C || letter == NoteLetter::F) {
            return std::nullopt;
        }
        return NotePosition{previous_letter(letter), octave, Accidental::Sharp};
    case Accidental::None:
        break;
    }
    return std::nullopt;
}

NotePosition NotePosition::from_midi_key(MidiKey key, Accidental preferred) {
    if (key < 0 || key > 127) {
        throw std::invalid_argument("MIDI key must be in range 0-127");
    }

    struct Spelling {
        NoteLetter letter;
        Accidental accidental;
    };
    static constexpr Spelling kSharps[12] = {
        {NoteLetter::C, Accidental::None}, {NoteLetter::C, Accidental::Sharp},
        {NoteLetter::D, Accidental::None}, {NoteLetter::D, Accidental::Sharp},
        {NoteLetter::E, Accidental::None}, {NoteLetter::F, Accidental::None},
        {NoteLetter::F, Accidental::Sharp}, {NoteLetter::G, Accidental::None},
        {NoteLetter::G, Accidental::Sharp}, {NoteLetter::A, Accidental::None},
        {NoteLetter::A, Accidental::Sharp}, {NoteLetter::B, Accidental::None},
    };

    Octave octave = key / 12 - 1;
    const Spelling& s = kSharps[key % 12];
    NotePosition note{s.letter, octave, s.accidental};
    if (preferred == Accidental::Flat && !note.is_natural()) {
        // Sharps on C/D/F/G/A always have a flat spelling in the same octave.
        return *note.alternative_accidental();
    }
    return note;
}

std::optional<NotePosition> NotePosition::parse(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    auto letter = letter_from_char(text.front());
    if (!letter) {
        return std::nullopt;
    }
    text.remove_prefix(1);

    Accidental accidental = Accidental::None;
    if (text.substr(0, kSharpSign.size()) == kSharpSign) {
        accidental = Accidental::Sharp;
        text.remove_prefix(kSharpSign.size());
    } else if (text.substr(0, kFlatSign.size()) == kFlatSign) {
        accidental = Accidental::Flat;
        text.remove_prefix(kFlatSign.size());
    } else if (!text.empty() && text.front() == '#') {
        accidental = Accidental::Sharp;
        text.remove_prefix(1);
    } else if (!text.empty() && text.front() == 'b') {
        accidental = Accidental::Flat;
        text.remove_prefix(1);
    }

    if (text.empty()) {
        return std::nullopt;
    }
    Octave octave{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, octave);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }

    MidiKey key = compute_midi_key(*letter, octave, accidental);
    if (key < 0 || key > 127) {
        return std::nullopt;
    }
    return NotePosition{*letter, octave, accidental};
}

bool operator==(const NotePosition& a, const NotePosition& b) noexcept {
    return a.letter == b.letter && a.octave == b.octave &&
           a.accidental == b.accidental;
}

bool operator!=(const NotePosition& a, const NotePosition& b) noexcept {
    return !(a == b);
}

bool operator<(const NotePosition& a, const NotePosition& b) noexcept {
    MidiKey ka = a.midi_key();
    MidiKey kb = b.midi_key();
    if (ka != kb) {
        return ka < kb;
    }
    // Same MIDI key: the lower letter name comes first. B♯3 and C4 share a
    // key but B belongs to the lower octave.
    if (a.octave != b.octave) {
        return a.octave < b.octave;
    }
    return static_cast<int>(a.letter) < static_cast<int>(b.letter);
}

bool operator>(const NotePosition& a, const NotePosition& b) noexcept {
    return b < a;
}

bool operator<=(const NotePosition& a, const NotePosition& b) noexcept {
    return !(b < a);
}

bool operator>=(const NotePosition& a, const NotePosition& b) noexcept {
    return !(a < b);
}

std::ostream& operator<<(std::ostream& out, const NotePosition& note) {
    return out << note.name();
}

const char* to_string(NoteLetter letter) noexcept {
    switch (letter) {
    case NoteLetter::C:
        return "C";
    case NoteLetter::D:
        return "D";
    case NoteLetter::E:
        return "E";
    case NoteLetter::F:
        return "F";
    case NoteLetter::G:
        return "G";
    case NoteLetter::A:
        return "A";
    case NoteLetter::B:
        return "B";
    }
    return "?";
}

}  // namespace interactive_piano
