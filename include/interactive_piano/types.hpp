#pragma once

#include <cstdint>

namespace interactive_piano {

// Basic type aliases used across the keyboard engine.
using MidiKey = int;
using Octave = int;

// Time in seconds, as supplied by the host's frame loop.
using Seconds = double;

// Horizontal and vertical measurements in logical pixels.
using Pixels = double;

// Index of a natural key within NoteRange::natural_positions().
using NaturalIndex = std::int64_t;

}  // namespace interactive_piano
