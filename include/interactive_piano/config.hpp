#pragma once

#include "interactive_piano/note_position.hpp"
#include "interactive_piano/render_config.hpp"
#include "interactive_piano/types.hpp"

#include <optional>
#include <vector>

namespace interactive_piano {

// Host-settable options of the interactive piano. Every field has a usable
// default; see sanitized() for how invalid values are handled.
struct InteractivePianoConfig {
    // Notes drawn with the highlight colour blended into their base colour.
    std::vector<NotePosition> highlighted_notes;

    ColorRGBA highlight_color{colors::kRed};
    ColorRGBA natural_color{colors::kWhite};
    ColorRGBA accidental_color{colors::kBlack};

    // Apply a repeating press animation to highlighted notes.
    bool animate_highlighted_notes{false};

    // Spell accidentals as flats instead of sharps. Affects the names shown
    // on keys and the value passed to the tapped callback.
    bool use_alternative_accidentals{false};

    bool hide_note_names{false};

    // Hide the scrollbar below the keys. This also disables user scrolling;
    // programmatic scrolling still works.
    bool hide_scrollbar{false};

    // Leave unset to size keys so the whole range fits the viewport.
    std::optional<Pixels> key_width;

    // Change at any time to scroll so that this note is centred.
    std::optional<NotePosition> note_to_scroll_to;

    // Copy with invalid values clamped to the nearest default: non-positive
    // or non-finite key widths select automatic sizing and colour channels
    // are clamped to [0, 1]. Each adjustment is logged as a warning.
    InteractivePianoConfig sanitized() const;

    bool is_highlighted(const NotePosition& note) const;
};

}  // namespace interactive_piano
