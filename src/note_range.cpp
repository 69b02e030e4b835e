#include "interactive_piano/note_range.hpp"

#include <algorithm>
#include <stdexcept>

namespace interactive_piano {

namespace {

struct ClefSpan {
    NotePosition low;
    NotePosition high;
};

ClefSpan clef_span(Clef clef, bool extended) {
    switch (clef) {
    case Clef::Treble:
        return extended ? ClefSpan{{NoteLetter::A, 3}, {NoteLetter::C, 6}}
                        : ClefSpan{{NoteLetter::E, 4}, {NoteLetter::F, 5}};
    case Clef::Bass:
        return extended ? ClefSpan{{NoteLetter::C, 2}, {NoteLetter::E, 4}}
                        : ClefSpan{{NoteLetter::G, 2}, {NoteLetter::A, 3}};
    case Clef::Alto:
        return extended ? ClefSpan{{NoteLetter::B, 2}, {NoteLetter::D, 5}}
                        : ClefSpan{{NoteLetter::F, 3}, {NoteLetter::G, 4}};
    }
    return ClefSpan{{NoteLetter::E, 4}, {NoteLetter::F, 5}};
}

}  // namespace

NoteRange::NoteRange(const NotePosition& from, const NotePosition& to)
    : from_(from), to_(to) {
    if (from_.midi_key() > to_.midi_key()) {
        throw std::invalid_argument("Note range must be ascending");
    }
}

NoteRange NoteRange::for_clefs(const std::vector<Clef>& clefs, bool extended) {
    if (clefs.empty()) {
        throw std::invalid_argument("Note range needs at least one clef");
    }
    ClefSpan span = clef_span(clefs.front(), extended);
    for (Clef clef : clefs) {
        ClefSpan s = clef_span(clef, extended);
        span.low = std::min(span.low, s.low);
        span.high = std::max(span.high, s.high);
    }
    return NoteRange{span.low, span.high};
}

std::vector<NotePosition> NoteRange::all_positions() const {
    std::vector<NotePosition> positions;
    positions.reserve(size());

    const MidiKey first = from_.midi_key();
    const MidiKey last = to_.midi_key();
    for (MidiKey key = first; key <= last; ++key) {
        if (key == first) {
            positions.push_back(from_);
        } else if (key == last) {
            positions.push_back(to_);
        } else {
            positions.push_back(NotePosition::from_midi_key(key));
        }
    }
    return positions;
}

std::vector<NotePosition> NoteRange::natural_positions() const {
    std::vector<NotePosition> positions = all_positions();
    positions.erase(std::remove_if(positions.begin(),
                                   positions.end(),
                                   [](const NotePosition& p) {
                                       return !p.is_natural();
                                   }),
                    positions.end());
    return positions;
}

bool NoteRange::contains(const NotePosition& note) const noexcept {
    MidiKey key = note.midi_key();
    return key >= from_.midi_key() && key <= to_.midi_key();
}

bool operator==(const NoteRange& a, const NoteRange& b) noexcept {
    return a.from() == b.from() && a.to() == b.to();
}

bool operator!=(const NoteRange& a, const NoteRange& b) noexcept {
    return !(a == b);
}

}  // namespace interactive_piano
