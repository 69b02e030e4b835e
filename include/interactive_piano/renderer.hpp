#pragma once

#include "interactive_piano/keyboard_geometry.hpp"
#include "interactive_piano/render_config.hpp"

#include <string>

#ifdef INTERACTIVE_PIANO_USE_IMGUI
#include <imgui.h>
#endif

namespace interactive_piano {

class InteractivePiano;

// Everything needed to paint one key, resolved from the piano state.
struct KeyVisual {
    ColorRGBA fill;
    ColorRGBA text_color;
    bool pressed{false};
    bool highlighted{false};
    bool middle_c_marker{false};
    bool show_text{true};
    std::string label;      // physical key label, empty when unmapped
    std::string note_name;
    float corner_radius{0.0f};
    float font_size{0.0f};
};

// Horizontal extent of the scrollbar thumb inside its track.
struct ScrollbarThumb {
    float offset{0.0f};
    float width{0.0f};
};

// Draws the key strip into a Dear ImGui window when built with
// INTERACTIVE_PIANO_USE_IMGUI. The visual resolution (colours, labels,
// thumb geometry) is independent of ImGui.
class KeyboardRenderer {
public:
    explicit KeyboardRenderer(KeyboardRenderConfig config = {});

    const KeyboardRenderConfig& config() const noexcept { return config_; }
    KeyboardRenderConfig& config() noexcept { return config_; }

    KeyVisual describe(const InteractivePiano& piano, const KeyRect& key) const;

    ScrollbarThumb scrollbar_thumb(const InteractivePiano& piano,
                                   float track_width) const noexcept;

#ifdef INTERACTIVE_PIANO_USE_IMGUI
    // Naturals first, then accidentals on top. `origin` is the screen
    // position of the strip's top-left corner.
    void render_keys(const InteractivePiano& piano,
                     ImDrawList* draw_list,
                     const ImVec2& origin) const;

    void render_scrollbar(const InteractivePiano& piano,
                          ImDrawList* draw_list,
                          const ImVec2& track_min,
                          const ImVec2& track_max) const;

private:
    void render_key(ImDrawList* draw_list,
                    const ImVec2& origin,
                    Pixels scroll_x,
                    const KeyRect& key,
                    const KeyVisual& visual) const;
#endif

private:
    KeyboardRenderConfig config_;
};

}  // namespace interactive_piano
