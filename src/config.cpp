#include "interactive_piano/config.hpp"

#include "interactive_piano/logger.hpp"

#include <algorithm>
#include <cmath>

namespace interactive_piano {

namespace {

ColorRGBA sanitize_color(const ColorRGBA& c, const char* field) {
    if (c.is_valid()) {
        return c;
    }
    Logger::global()->log_warning("%s has channels outside [0, 1]; clamped", field);
    return c.clamped();
}

}  // namespace

InteractivePianoConfig InteractivePianoConfig::sanitized() const {
    InteractivePianoConfig cfg = *this;

    if (cfg.key_width &&
        (!std::isfinite(*cfg.key_width) || *cfg.key_width <= 0.0)) {
        Logger::global()->log_warning(
            "key_width %g is not a positive width; using automatic sizing",
            *cfg.key_width);
        cfg.key_width.reset();
    }

    cfg.highlight_color = sanitize_color(cfg.highlight_color, "highlight_color");
    cfg.natural_color = sanitize_color(cfg.natural_color, "natural_color");
    cfg.accidental_color = sanitize_color(cfg.accidental_color, "accidental_color");

    return cfg;
}

bool InteractivePianoConfig::is_highlighted(const NotePosition& note) const {
    auto alt = note.alternative_accidental();
    return std::any_of(highlighted_notes.begin(),
                       highlighted_notes.end(),
                       [&](const NotePosition& h) {
                           return h == note || (alt && h == *alt);
                       });
}

}  // namespace interactive_piano
