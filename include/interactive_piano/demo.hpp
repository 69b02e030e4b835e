#pragma once

#include "interactive_piano/widget.hpp"

namespace interactive_piano {

// Simple demo helper that renders a treble-clef keyboard with its own
// internal InteractivePiano, a few option toggles and a log of tapped notes.
// When built with INTERACTIVE_PIANO_USE_IMGUI, this draws into the current
// Dear ImGui window. Otherwise it is a no-op.
void RenderInteractivePianoDemo();

// Variant that renders a caller-owned piano. The demo controls edit the
// piano's configuration in place.
void RenderInteractivePianoDemo(InteractivePiano& piano);

}  // namespace interactive_piano
