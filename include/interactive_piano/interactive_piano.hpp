#pragma once

// Convenience umbrella header for the interactive piano.
// Pulls in the main public types and the high-level widget.

#include "interactive_piano/types.hpp"
#include "interactive_piano/logger.hpp"
#include "interactive_piano/note_position.hpp"
#include "interactive_piano/note_range.hpp"
#include "interactive_piano/key_groups.hpp"
#include "interactive_piano/keyboard_geometry.hpp"
#include "interactive_piano/scroll_controller.hpp"
#include "interactive_piano/physical_key_map.hpp"
#include "interactive_piano/key_state.hpp"
#include "interactive_piano/keyboard.hpp"
#include "interactive_piano/config.hpp"
#include "interactive_piano/render_config.hpp"
#include "interactive_piano/renderer.hpp"
#include "interactive_piano/demo.hpp"
#include "interactive_piano/widget.hpp"
