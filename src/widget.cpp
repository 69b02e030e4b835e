#include "interactive_piano/widget.hpp"

#include "interactive_piano/logger.hpp"

#include <cmath>
#include <utility>

#ifdef INTERACTIVE_PIANO_USE_IMGUI
#include <imgui.h>
#endif

namespace interactive_piano {

InteractivePiano::InteractivePiano(NoteRange range,
                                   InteractivePianoConfig config)
    : range_(std::move(range)),
      config_(config.sanitized()),
      keyboard_(key_state_) {
    geometry_.set_key_width(config_.key_width);
    keyboard_.set_use_alternative_accidentals(
        config_.use_alternative_accidentals);

    key_state_.set_state_changed_callback(
        [this](const NotePosition&, bool) { request_repaint(); });
    scroll_.on_scroll_update = [this](Pixels) {
        sync_viewport();
        request_repaint();
    };

    refresh_groups();
}

InteractivePiano::~InteractivePiano() {
    if (!disposed_) {
        dispose();
    }
}

bool InteractivePiano::check_alive(const char* operation) const {
    if (disposed_) {
        Logger::global()->log_warning(
            "InteractivePiano::%s called after dispose; ignored", operation);
        return false;
    }
    return true;
}

void InteractivePiano::set_note_range(const NoteRange& range) {
    if (!check_alive("set_note_range") || range == range_) {
        return;
    }
    range_ = range;
    refresh_groups();

    // The scroll extent changed with the key count; keep the target centred.
    if (scroll_.has_position() && geometry_.is_measured()) {
        scroll_.jump_to(target_scroll_offset());
    }
}

void InteractivePiano::set_config(const InteractivePianoConfig& config) {
    if (!check_alive("set_config")) {
        return;
    }
    InteractivePianoConfig cfg = config.sanitized();

    const bool spelling_changed =
        cfg.use_alternative_accidentals != config_.use_alternative_accidentals;
    const bool target_changed = cfg.note_to_scroll_to != config_.note_to_scroll_to;
    const bool key_width_changed = cfg.key_width != config_.key_width;

    config_ = std::move(cfg);
    keyboard_.set_use_alternative_accidentals(
        config_.use_alternative_accidentals);

    if (spelling_changed) {
        // Pressed names are spelled the old way; drop them with the groups.
        key_state_.clear();
        held_keys_.clear();
        refresh_groups();
    }

    if (key_width_changed) {
        geometry_.set_key_width(config_.key_width);
        scroll_.set_max_scroll(geometry_.max_scroll());
        sync_viewport();
        rebuild_layout();
        if (config_.note_to_scroll_to && scroll_.has_position() &&
            geometry_.is_measured()) {
            scroll_.jump_to(target_scroll_offset());
        }
    }

    if (target_changed && config_.note_to_scroll_to &&
        scroll_.has_position() && geometry_.is_measured()) {
        scroll_.animate_to(target_scroll_offset(), kArrowScrollDuration);
    }

    request_repaint();
}

void InteractivePiano::refresh_groups() {
    group_cache_.groups(range_, config_.use_alternative_accidentals);
    naturals_ = range_.natural_positions();
    geometry_.set_natural_count(naturals_.size());
    scroll_.set_max_scroll(geometry_.max_scroll());
    sync_viewport();
    rebuild_layout();
}

void InteractivePiano::rebuild_layout() {
    layout_ = geometry_.build_layout(group_cache_.cached());
}

void InteractivePiano::sync_viewport() {
    geometry_.viewport().x = scroll_.offset();
}

void InteractivePiano::request_repaint() {
    if (on_repaint_) {
        on_repaint_();
    }
}

Pixels InteractivePiano::target_scroll_offset() const {
    NotePosition target =
        config_.note_to_scroll_to.value_or(NotePosition::middle_c());
    if (!config_.note_to_scroll_to && !range_.contains(target)) {
        return 0.0;
    }
    Pixels offset = geometry_.scroll_offset_for(target, naturals_);
    if (offset == 0.0 && !geometry_.natural_index_of(target, naturals_)) {
        Logger::global()->log_diagnostic(
            "Scroll target %s is outside the range; using offset 0",
            target.name().c_str());
    }
    return offset;
}

void InteractivePiano::layout(Pixels viewport_width, Pixels viewport_height) {
    if (!check_alive("layout")) {
        return;
    }

    const Viewport before = geometry_.viewport();
    const Pixels key_width_before = geometry_.key_width();

    geometry_.set_viewport_size(viewport_width, viewport_height);
    const Viewport& after = geometry_.viewport();
    const bool size_changed =
        before.width != after.width || before.height != after.height;
    const bool key_width_changed = key_width_before != geometry_.key_width();

    if (size_changed) {
        scroll_.set_max_scroll(geometry_.max_scroll());
        sync_viewport();
        rebuild_layout();
    }

    if (!geometry_.is_measured()) {
        return;
    }

    if (!scroll_.has_position()) {
        scroll_.initialize(target_scroll_offset());
    } else if (config_.note_to_scroll_to &&
               (before.width != after.width || key_width_changed)) {
        scroll_.jump_to(target_scroll_offset());
    }
    sync_viewport();
}

bool InteractivePiano::on_pointer(Pixels x, Pixels y, bool down) {
    if (!check_alive("on_pointer")) {
        return false;
    }

    std::optional<NotePosition> note =
        geometry_.hit_test(layout_, geometry_.screen_to_content(x), y);

    const bool entered = note != hovered_note_;
    const bool went_down = down && !pointer_down_;
    hovered_note_ = note;
    pointer_down_ = down;

    if (!note || !down || !(entered || went_down)) {
        return false;
    }
    return key_state_.press_begin(*note, InputSource::Pointer);
}

bool InteractivePiano::tap(const NotePosition& note) {
    if (!check_alive("tap")) {
        return false;
    }
    return key_state_.press_begin(
        preferred_spelling(note, config_.use_alternative_accidentals),
        InputSource::Pointer);
}

bool InteractivePiano::on_key_event(char label, KeyAction action) {
    if (!check_alive("on_key_event")) {
        return false;
    }
    return keyboard_.on_key_event(label, action);
}

void InteractivePiano::scroll_by_keys(int keys) {
    if (!check_alive("scroll_by_keys") || !geometry_.is_measured() ||
        !scroll_.has_position()) {
        return;
    }
    Pixels from = scroll_.animation_target().value_or(scroll_.offset());
    scroll_.animate_to(from + static_cast<double>(keys) * geometry_.key_width(),
                       kArrowScrollDuration);
}

bool InteractivePiano::user_scroll(Pixels delta) {
    if (!check_alive("user_scroll")) {
        return false;
    }
    if (config_.hide_scrollbar) {
        return false;
    }
    if (!scroll_.has_position()) {
        return false;
    }
    scroll_.jump_to(scroll_.offset() + delta);
    return true;
}

void InteractivePiano::update(Seconds delta_seconds) {
    if (!check_alive("update")) {
        return;
    }
    if (!std::isfinite(delta_seconds) || delta_seconds < 0.0) {
        return;
    }
    elapsed_ += delta_seconds;
    key_state_.advance(delta_seconds);
    scroll_.advance(delta_seconds);
    if (config_.animate_highlighted_notes && !config_.highlighted_notes.empty()) {
        request_repaint();
    }
}

bool InteractivePiano::highlight_pressed_phase() const noexcept {
    if (!config_.animate_highlighted_notes) {
        return false;
    }
    double phase = std::fmod(elapsed_, kHighlightAnimationPeriod);
    return phase < kHighlightAnimationPeriod / 2.0;
}

bool InteractivePiano::key_appears_pressed(const NotePosition& note) const {
    if (key_state_.is_pressed(note)) {
        return true;
    }
    return highlight_pressed_phase() && config_.is_highlighted(note);
}

void InteractivePiano::dispose() {
    if (disposed_) {
        Logger::global()->log_warning("InteractivePiano disposed twice");
        return;
    }
    key_state_.set_state_changed_callback(nullptr);
    key_state_.set_note_tapped_callback(nullptr);
    key_state_.clear();
    scroll_.dispose();
    held_keys_.clear();
    on_repaint_ = nullptr;
    disposed_ = true;
}

void InteractivePiano::draw() {
#ifdef INTERACTIVE_PIANO_USE_IMGUI
    if (disposed_) {
        return;
    }
    const KeyboardRenderConfig& style = renderer_.config();

    ImGui::PushID(this);

    // Arrow buttons above the keys.
    const float row_start_x = ImGui::GetCursorPosX();
    const float full_width = ImGui::GetContentRegionAvail().x;
    if (ImGui::ArrowButton("##scroll_left", ImGuiDir_Left)) {
        scroll_by_keys(-1);
    }
    ImGui::SameLine(row_start_x + full_width - ImGui::GetFrameHeight());
    if (ImGui::ArrowButton("##scroll_right", ImGuiDir_Right)) {
        scroll_by_keys(1);
    }

    ImVec2 avail = ImGui::GetContentRegionAvail();
    float strip_height = avail.y;
    if (!config_.hide_scrollbar) {
        strip_height -= style.scrollbar_height + ImGui::GetStyle().ItemSpacing.y;
    }
    if (avail.x <= 0.0f || strip_height <= 0.0f) {
        ImGui::PopID();
        return;
    }

    layout(static_cast<Pixels>(avail.x), static_cast<Pixels>(strip_height));

    ImGui::InvisibleButton("##keys", ImVec2(avail.x, strip_height));
    const bool keys_hovered = ImGui::IsItemHovered();
    ImVec2 origin = ImGui::GetItemRectMin();

    handle_pointer_events();

    if (keys_hovered && !config_.hide_scrollbar) {
        ImGuiIO& io = ImGui::GetIO();
        float wheel = io.MouseWheelH != 0.0f ? io.MouseWheelH : io.MouseWheel;
        if (wheel != 0.0f) {
            user_scroll(-static_cast<Pixels>(wheel) * geometry_.key_width());
        }
    }

    renderer_.render_keys(*this, ImGui::GetWindowDrawList(), origin);

    if (!config_.hide_scrollbar) {
        ImGui::InvisibleButton("##scrollbar", ImVec2(avail.x, style.scrollbar_height));
        if (ImGui::IsItemActive() && geometry_.content_width() > 0.0) {
            double ratio = geometry_.content_width() / static_cast<double>(avail.x);
            user_scroll(static_cast<Pixels>(ImGui::GetIO().MouseDelta.x) * ratio);
        }
        renderer_.render_scrollbar(*this,
                                   ImGui::GetWindowDrawList(),
                                   ImGui::GetItemRectMin(),
                                   ImGui::GetItemRectMax());
    }

    if (ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) {
        handle_keyboard_events();
    }

    ImGui::PopID();
#else
    // No Dear ImGui; nothing to draw.
#endif
}

void InteractivePiano::handle_pointer_events() {
#ifdef INTERACTIVE_PIANO_USE_IMGUI
    ImVec2 canvas_min = ImGui::GetItemRectMin();
    ImVec2 canvas_max = ImGui::GetItemRectMax();
    ImVec2 mouse = ImGui::GetIO().MousePos;
    const bool down = ImGui::IsMouseDown(ImGuiMouseButton_Left);

    if (mouse.x < canvas_min.x || mouse.x >= canvas_max.x ||
        mouse.y < canvas_min.y || mouse.y >= canvas_max.y ||
        !ImGui::IsWindowHovered()) {
        // Leaving the strip ends hover; re-entering while down is a new enter.
        hovered_note_.reset();
        pointer_down_ = down;
        return;
    }

    on_pointer(static_cast<Pixels>(mouse.x - canvas_min.x),
               static_cast<Pixels>(mouse.y - canvas_min.y),
               down);
#endif
}

void InteractivePiano::handle_keyboard_events() {
#ifdef INTERACTIVE_PIANO_USE_IMGUI
    struct KeyChar {
        ImGuiKey key;
        char base;
    };
    static constexpr KeyChar kKeys[] = {
        {ImGuiKey_1, '1'}, {ImGuiKey_2, '2'}, {ImGuiKey_3, '3'},
        {ImGuiKey_A, 'a'}, {ImGuiKey_B, 'b'}, {ImGuiKey_C, 'c'},
        {ImGuiKey_D, 'd'}, {ImGuiKey_E, 'e'}, {ImGuiKey_F, 'f'},
        {ImGuiKey_G, 'g'}, {ImGuiKey_H, 'h'}, {ImGuiKey_I, 'i'},
        {ImGuiKey_J, 'j'}, {ImGuiKey_K, 'k'}, {ImGuiKey_L, 'l'},
        {ImGuiKey_M, 'm'}, {ImGuiKey_N, 'n'}, {ImGuiKey_O, 'o'},
        {ImGuiKey_P, 'p'}, {ImGuiKey_Q, 'q'}, {ImGuiKey_R, 'r'},
        {ImGuiKey_S, 's'}, {ImGuiKey_T, 't'}, {ImGuiKey_U, 'u'},
        {ImGuiKey_V, 'v'}, {ImGuiKey_W, 'w'}, {ImGuiKey_X, 'x'},
        {ImGuiKey_Y, 'y'}, {ImGuiKey_Z, 'z'},
    };

    ImGuiIO& io = ImGui::GetIO();
    if (io.WantTextInput) {
        return;
    }

    for (const KeyChar& k : kKeys) {
        const int id = static_cast<int>(k.key);
        if (ImGui::IsKeyPressed(k.key, /*repeat=*/false)) {
            char label = apply_shift(k.base, io.KeyShift);
            held_keys_[id] = label;
            on_key_event(label, KeyAction::Down);
        } else if (ImGui::IsKeyPressed(k.key, /*repeat=*/true)) {
            auto it = held_keys_.find(id);
            if (it != held_keys_.end()) {
                on_key_event(it->second, KeyAction::Repeat);
            }
        }
        if (ImGui::IsKeyReleased(k.key)) {
            // Release what the key-down played, even if shift changed since.
            auto it = held_keys_.find(id);
            if (it != held_keys_.end()) {
                char label = it->second;
                held_keys_.erase(it);
                on_key_event(label, KeyAction::Up);
            }
        }
    }
#endif
}

}  // namespace interactive_piano
