#pragma once

// This header intentionally avoids depending on Dear ImGui so the engine can
// compile without ImGui present. When INTERACTIVE_PIANO_USE_IMGUI is defined,
// the renderer converts these colours to ImGui types.

#include <algorithm>
#include <cmath>

namespace interactive_piano {

struct ColorRGBA {
    float r{0.0f};
    float g{0.0f};
    float b{0.0f};
    float a{1.0f};

    constexpr ColorRGBA() = default;
    constexpr ColorRGBA(float red, float green, float blue, float alpha = 1.0f)
        : r(red), g(green), b(blue), a(alpha) {}

    // Copy with every channel clamped to [0, 1]; NaN channels become 0.
    ColorRGBA clamped() const noexcept {
        auto c = [](float v) {
            return std::isnan(v) ? 0.0f : std::clamp(v, 0.0f, 1.0f);
        };
        return ColorRGBA{c(r), c(g), c(b), c(a)};
    }

    bool is_valid() const noexcept {
        auto ok = [](float v) { return v >= 0.0f && v <= 1.0f; };
        return ok(r) && ok(g) && ok(b) && ok(a);
    }
};

inline bool operator==(const ColorRGBA& x, const ColorRGBA& y) noexcept {
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}

inline bool operator!=(const ColorRGBA& x, const ColorRGBA& y) noexcept {
    return !(x == y);
}

// Linear interpolation between two colours, t in [0, 1].
inline ColorRGBA lerp(const ColorRGBA& from, const ColorRGBA& to, float t) noexcept {
    t = std::clamp(t, 0.0f, 1.0f);
    return ColorRGBA{from.r + (to.r - from.r) * t,
                     from.g + (to.g - from.g) * t,
                     from.b + (to.b - from.b) * t,
                     from.a + (to.a - from.a) * t};
}

namespace colors {
inline constexpr ColorRGBA kWhite{1.0f, 1.0f, 1.0f, 1.0f};
inline constexpr ColorRGBA kBlack{0.0f, 0.0f, 0.0f, 1.0f};
inline constexpr ColorRGBA kRed{0.96f, 0.26f, 0.21f, 1.0f};
}  // namespace colors

// Visual constants of the key strip that are not host-configurable.
struct KeyboardRenderConfig {
    // Highlighted keys are drawn halfway between their base colour and the
    // highlight colour.
    float highlight_blend{0.5f};

    // Pressed keys are darkened by this factor.
    float pressed_shade{0.75f};

    // Bottom corner radius relative to key width.
    float corner_radius_factor{0.2f};

    // Label font size is key width divided by this.
    float label_font_divisor{3.5f};

    // Label baseline distance from the key bottom, relative to key width.
    float label_bottom_factor{1.0f / 3.0f};

    ColorRGBA border_color{0.0f, 0.0f, 0.0f, 0.35f};
    ColorRGBA natural_text_color{colors::kBlack};
    ColorRGBA accidental_text_color{colors::kWhite};
    ColorRGBA middle_c_marker_color{colors::kRed};
    ColorRGBA middle_c_text_color{colors::kWhite};

    float scrollbar_height{10.0f};
    ColorRGBA scrollbar_track_color{0.0f, 0.0f, 0.0f, 0.10f};
    ColorRGBA scrollbar_thumb_color{0.0f, 0.0f, 0.0f, 0.40f};
};

// Fill colour of a key given its base colour and optional highlight.
inline ColorRGBA key_fill_color(const ColorRGBA& base,
                                const ColorRGBA* highlight,
                                bool pressed,
                                const KeyboardRenderConfig& config) noexcept {
    ColorRGBA c = highlight ? lerp(base, *highlight, config.highlight_blend) : base;
    if (pressed) {
        c.r *= config.pressed_shade;
        c.g *= config.pressed_shade;
        c.b *= config.pressed_shade;
        // Black keys would not visibly change; lift them instead.
        if (c.r + c.g + c.b < 0.3f) {
            c = lerp(c, colors::kWhite, 1.0f - config.pressed_shade);
        }
    }
    return c;
}

}  // namespace interactive_piano
