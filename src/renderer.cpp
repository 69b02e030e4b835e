#include "interactive_piano/renderer.hpp"

#include "interactive_piano/widget.hpp"

#include <algorithm>
#include <cfloat>

namespace interactive_piano {

KeyboardRenderer::KeyboardRenderer(KeyboardRenderConfig config)
    : config_(config) {}

KeyVisual KeyboardRenderer::describe(const InteractivePiano& piano,
                                     const KeyRect& key) const {
    const InteractivePianoConfig& cfg = piano.config();
    const float key_width = static_cast<float>(piano.geometry().key_width());

    KeyVisual v;
    v.highlighted = piano.is_highlighted(key.note);
    v.pressed = piano.key_appears_pressed(key.note);
    v.middle_c_marker = key.note == NotePosition::middle_c();
    v.show_text = !cfg.hide_note_names;
    v.note_name = key.note.name();
    if (auto label = piano.key_label(key.note)) {
        v.label = std::string(1, *label);
    }

    const ColorRGBA& base = key.accidental ? cfg.accidental_color : cfg.natural_color;
    v.fill = key_fill_color(base,
                            v.highlighted ? &cfg.highlight_color : nullptr,
                            v.pressed,
                            config_);

    if (key.accidental) {
        v.text_color = config_.accidental_text_color;
    } else if (v.middle_c_marker) {
        v.text_color = config_.middle_c_text_color;
    } else {
        v.text_color = config_.natural_text_color;
    }

    v.corner_radius = key_width * config_.corner_radius_factor;
    v.font_size = config_.label_font_divisor > 0.0f
                      ? key_width / config_.label_font_divisor
                      : 0.0f;
    return v;
}

ScrollbarThumb KeyboardRenderer::scrollbar_thumb(const InteractivePiano& piano,
                                                 float track_width) const noexcept {
    const KeyboardGeometry& geometry = piano.geometry();
    const double content = geometry.content_width();
    const double visible = geometry.viewport().width;
    if (track_width <= 0.0f || content <= 0.0 || visible >= content) {
        return ScrollbarThumb{0.0f, std::max(track_width, 0.0f)};
    }

    const float ratio = static_cast<float>(visible / content);
    ScrollbarThumb thumb;
    thumb.width = std::max(track_width * ratio, config_.scrollbar_height);
    const double max_scroll = geometry.max_scroll();
    const float t = max_scroll > 0.0
                        ? static_cast<float>(piano.scroll_offset() / max_scroll)
                        : 0.0f;
    thumb.offset = std::clamp(t, 0.0f, 1.0f) * (track_width - thumb.width);
    return thumb;
}

}  // namespace interactive_piano

#ifdef INTERACTIVE_PIANO_USE_IMGUI
namespace interactive_piano {

namespace {

ImU32 to_color(const ColorRGBA& c) {
    return ImGui::ColorConvertFloat4ToU32(ImVec4(c.r, c.g, c.b, c.a));
}

}  // namespace

void KeyboardRenderer::render_keys(const InteractivePiano& piano,
                                   ImDrawList* draw_list,
                                   const ImVec2& origin) const {
    const KeyLayout& layout = piano.key_layout();
    const Viewport& vp = piano.geometry().viewport();

    ImVec2 clip_max(origin.x + static_cast<float>(vp.width),
                    origin.y + static_cast<float>(vp.height));
    draw_list->PushClipRect(origin, clip_max, true);

    // Two passes so accidentals always end up above their neighbours.
    for (int pass = 0; pass < 2; ++pass) {
        const bool accidentals = pass == 1;
        for (const KeyRect& key : layout) {
            if (key.accidental != accidentals) {
                continue;
            }
            if (key.outer.right < vp.x || key.outer.left > vp.x + vp.width) {
                continue;
            }
            render_key(draw_list, origin, vp.x, key, describe(piano, key));
        }
    }

    draw_list->PopClipRect();
}

void KeyboardRenderer::render_key(ImDrawList* draw_list,
                                  const ImVec2& origin,
                                  Pixels scroll_x,
                                  const KeyRect& key,
                                  const KeyVisual& visual) const {
    const Rect body = key.body();
    ImVec2 p0(origin.x + static_cast<float>(body.left - scroll_x),
              origin.y + static_cast<float>(body.top));
    ImVec2 p1(origin.x + static_cast<float>(body.right - scroll_x),
              origin.y + static_cast<float>(body.bottom));

    draw_list->AddRectFilled(p0, p1, to_color(visual.fill),
                             visual.corner_radius,
                             ImDrawFlags_RoundCornersBottom);
    draw_list->AddRect(p0, p1, to_color(config_.border_color),
                       visual.corner_radius,
                       ImDrawFlags_RoundCornersBottom);

    const float key_w = p1.x - p0.x;
    const float center_x = (p0.x + p1.x) * 0.5f;
    const float outer_w = static_cast<float>(key.outer.width());
    const float bottom = p1.y - outer_w * config_.label_bottom_factor;

    ImFont* font = ImGui::GetFont();
    const float font_size = visual.font_size;
    float text_h = 0.0f;
    ImVec2 label_size(0.0f, 0.0f);
    ImVec2 name_size(0.0f, 0.0f);
    if (visual.show_text && font_size > 0.0f) {
        if (!visual.label.empty()) {
            label_size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f,
                                             visual.label.c_str());
        }
        name_size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f,
                                        visual.note_name.c_str());
        text_h = label_size.y + name_size.y;
    }

    if (visual.middle_c_marker) {
        float radius = visual.show_text
                           ? std::max(std::max(label_size.x, name_size.x), text_h) * 0.5f + 2.0f
                           : key_w * 0.25f;
        radius = std::min(radius, key_w * 0.5f);
        float cy = bottom - (visual.show_text ? text_h * 0.5f : radius);
        draw_list->AddCircleFilled(ImVec2(center_x, cy), radius,
                                   to_color(config_.middle_c_marker_color));
    }

    if (!visual.show_text || font_size <= 0.0f) {
        return;
    }

    ImU32 text_color = to_color(visual.text_color);
    float y = bottom - text_h;
    if (!visual.label.empty()) {
        draw_list->AddText(font, font_size,
                           ImVec2(center_x - label_size.x * 0.5f, y),
                           text_color, visual.label.c_str());
    }
    y += label_size.y;
    draw_list->AddText(font, font_size,
                       ImVec2(center_x - name_size.x * 0.5f, y),
                       text_color, visual.note_name.c_str());
}

void KeyboardRenderer::render_scrollbar(const InteractivePiano& piano,
                                        ImDrawList* draw_list,
                                        const ImVec2& track_min,
                                        const ImVec2& track_max) const {
    const float track_w = track_max.x - track_min.x;
    const float rounding = (track_max.y - track_min.y) * 0.5f;
    draw_list->AddRectFilled(track_min, track_max,
                             to_color(config_.scrollbar_track_color), rounding);

    ScrollbarThumb thumb = scrollbar_thumb(piano, track_w);
    if (thumb.width <= 0.0f || thumb.width >= track_w) {
        return;
    }
    draw_list->AddRectFilled(ImVec2(track_min.x + thumb.offset, track_min.y),
                             ImVec2(track_min.x + thumb.offset + thumb.width,
                                    track_max.y),
                             to_color(config_.scrollbar_thumb_color), rounding);
}

}  // namespace interactive_piano
#endif
