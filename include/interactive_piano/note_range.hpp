#pragma once

#include "interactive_piano/note_position.hpp"

#include <vector>

namespace interactive_piano {

enum class Clef {
    Treble,
    Bass,
    Alto,
};

// Ascending, contiguous, inclusive range of keys. Black keys inside the range
// are spelled as sharps; the endpoints keep the spelling they were given.
class NoteRange {
public:
    // Throws std::invalid_argument when `from` is above `to`.
    NoteRange(const NotePosition& from, const NotePosition& to);

    // Union of the staff ranges of the given clefs. With `extended`, each
    // clef also covers a few ledger lines above and below the staff.
    // Throws std::invalid_argument for an empty clef list.
    static NoteRange for_clefs(const std::vector<Clef>& clefs,
                               bool extended = false);

    const NotePosition& from() const noexcept { return from_; }
    const NotePosition& to() const noexcept { return to_; }

    // Every key in the range, in piano order.
    std::vector<NotePosition> all_positions() const;

    // White keys only. Accidentals are drawn as overlays and add no width, so
    // geometry is computed on this sequence.
    std::vector<NotePosition> natural_positions() const;

    bool contains(const NotePosition& note) const noexcept;

    std::size_t size() const noexcept {
        return static_cast<std::size_t>(to_.midi_key() - from_.midi_key() + 1);
    }

private:
    NotePosition from_;
    NotePosition to_;
};

bool operator==(const NoteRange& a, const NoteRange& b) noexcept;
bool operator!=(const NoteRange& a, const NoteRange& b) noexcept;

}  // namespace interactive_piano
