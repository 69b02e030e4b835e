#pragma once

#include "interactive_piano/config.hpp"
#include "interactive_piano/key_groups.hpp"
#include "interactive_piano/key_state.hpp"
#include "interactive_piano/keyboard.hpp"
#include "interactive_piano/keyboard_geometry.hpp"
#include "interactive_piano/note_range.hpp"
#include "interactive_piano/render_config.hpp"
#include "interactive_piano/renderer.hpp"
#include "interactive_piano/scroll_controller.hpp"

#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace interactive_piano {

// Scrollable interactive keyboard that ties together the engine components
// (grouping, geometry, scroll position, press state, keyboard mapping) and
// the optional Dear ImGui front end.
//
// All calls are expected on the host's UI thread. Time only moves through
// update(), which the host calls once per frame.
class InteractivePiano {
public:
    static constexpr Seconds kArrowScrollDuration = 0.5;
    static constexpr Seconds kHighlightAnimationPeriod = 1.0;

    explicit InteractivePiano(NoteRange range,
                              InteractivePianoConfig config = {});
    ~InteractivePiano();

    InteractivePiano(const InteractivePiano&) = delete;
    InteractivePiano& operator=(const InteractivePiano&) = delete;

    const NoteRange& note_range() const noexcept { return range_; }
    void set_note_range(const NoteRange& range);

    const InteractivePianoConfig& config() const noexcept { return config_; }

    // Apply a new configuration. Groups are only recomputed when the
    // spelling preference changes; a changed scroll target animates there.
    void set_config(const InteractivePianoConfig& config);

    // Invoked with the display name of a note each time a press begins.
    void set_note_tapped_callback(KeyStateMachine::NoteTappedCallback cb) {
        key_state_.set_note_tapped_callback(std::move(cb));
    }

    // Invoked whenever something visible changed (press state, scroll).
    using RepaintCallback = std::function<void()>;
    void set_repaint_callback(RepaintCallback cb) {
        on_repaint_ = std::move(cb);
    }

    // Layout pass with the size available to the key strip. The first pass
    // that yields a usable key width initialises the scroll position; later
    // passes that change the viewport or key width keep the target centred.
    void layout(Pixels viewport_width, Pixels viewport_height);

    // Pointer position in viewport-local coordinates. A press begins when the
    // pointer goes down on a key, or enters a key while already down.
    // Returns true if a press began.
    bool on_pointer(Pixels x, Pixels y, bool down);

    // Direct tap on a note, independent of layout and of the physical map.
    bool tap(const NotePosition& note);

    // Computer-keyboard input, see KeyboardController.
    bool on_key_event(char label, KeyAction action);

    // Arrow-button scrolling by whole keys (negative scrolls left).
    void scroll_by_keys(int keys);

    // Wheel/drag scrolling. Ignored while the scrollbar is hidden.
    bool user_scroll(Pixels delta);

    // Advance release timers, scroll animation and highlight animation.
    void update(Seconds delta_seconds);

    const std::vector<RenderGroup>& groups() const noexcept {
        return group_cache_.cached();
    }
    const std::vector<NotePosition>& naturals() const noexcept {
        return naturals_;
    }
    const KeyLayout& key_layout() const noexcept { return layout_; }
    const KeyboardGeometry& geometry() const noexcept { return geometry_; }
    const ScrollController& scroll() const noexcept { return scroll_; }
    const KeyStateMachine& key_state() const noexcept { return key_state_; }
    std::size_t group_recompute_count() const noexcept {
        return group_cache_.recompute_count();
    }

    Pixels scroll_offset() const noexcept { return scroll_.offset(); }

    // Offset that centres note_to_scroll_to (or middle C when no target is
    // set), without clamping. 0 when the note is outside the range.
    Pixels target_scroll_offset() const;

    bool is_pressed(const NotePosition& note) const {
        return key_state_.is_pressed(note);
    }
    bool is_highlighted(const NotePosition& note) const {
        return config_.is_highlighted(note);
    }

    // True during the "down" half of the highlight animation cycle.
    bool highlight_pressed_phase() const noexcept;

    // Whether a key should be drawn pressed: actually pressed, or
    // highlighted and animated while in the down phase.
    bool key_appears_pressed(const NotePosition& note) const;

    std::optional<char> key_label(const NotePosition& note) const {
        return label_for_note(note);
    }

    // Release engine resources. Must happen once; further mutating calls are
    // ignored with a warning. The destructor disposes if needed.
    void dispose();
    bool disposed() const noexcept { return disposed_; }

    KeyboardRenderer& renderer() noexcept { return renderer_; }

    // Draw the widget inside the current Dear ImGui window. When built
    // without INTERACTIVE_PIANO_USE_IMGUI, this function is a no-op.
    void draw();

private:
    NoteRange range_;
    InteractivePianoConfig config_;
    KeyGroupCache group_cache_;
    std::vector<NotePosition> naturals_;
    KeyboardGeometry geometry_;
    KeyLayout layout_;
    ScrollController scroll_;
    KeyStateMachine key_state_;
    KeyboardController keyboard_;
    KeyboardRenderer renderer_;

    RepaintCallback on_repaint_{};
    bool disposed_{false};
    Seconds elapsed_{0.0};

    // Pointer tracking for enter-while-down presses.
    std::optional<NotePosition> hovered_note_;
    bool pointer_down_{false};

    // ImGui keys currently held, with the label they produced on key-down.
    std::unordered_map<int, char> held_keys_;

    bool check_alive(const char* operation) const;
    void refresh_groups();
    void rebuild_layout();
    void sync_viewport();
    void request_repaint();

    void handle_pointer_events();
    void handle_keyboard_events();
};

}  // namespace interactive_piano
