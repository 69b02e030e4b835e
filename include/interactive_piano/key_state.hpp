#pragma once

#include "interactive_piano/note_position.hpp"
#include "interactive_piano/types.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace interactive_piano {

enum class InputSource {
    // Pointer hover/tap. There is no reliable "up" signal, so the press is
    // released automatically after a fixed delay.
    Pointer,
    // Computer keyboard. Key-up releases the note.
    Physical,
};

// Per-note press state, keyed by display name. A note is either released
// (the default for notes never touched) or pressed.
//
// A press on a note that is already pressed is ignored, so key repeat and
// re-entrant hover events fire the host callback once per gesture.
//
// Pointer presses schedule a release kPointerReleaseDelay after the press.
// The release is not rescheduled by an ignored re-press: it still fires at
// the original deadline, so a note pressed again within the delay may be
// shown released up to one delay period early.
class KeyStateMachine {
public:
    static constexpr Seconds kPointerReleaseDelay = 0.150;

    using NoteTappedCallback = std::function<void(const std::string& note_name)>;
    using StateChangedCallback =
        std::function<void(const NotePosition& note, bool pressed)>;

    // Begin a press. Returns true if the note transitioned to pressed (and
    // the tapped callback fired), false if it was already pressed.
    bool press_begin(const NotePosition& note, InputSource source);

    // End a press (physical key-up). Returns true if the note was pressed.
    bool press_end(const NotePosition& note);

    // Advance the internal clock and fire releases that are due.
    void advance(Seconds delta_seconds);

    bool is_pressed(const NotePosition& note) const;
    bool is_pressed(std::string_view note_name) const;

    // Source of the current press, if the note is pressed.
    std::optional<InputSource> pressed_source(const NotePosition& note) const;

    std::size_t pressed_count() const noexcept;
    std::size_t pending_release_count() const noexcept { return pending_.size(); }
    std::optional<Seconds> next_release_deadline() const noexcept;

    Seconds now() const noexcept { return now_; }

    Seconds release_delay() const noexcept { return release_delay_; }
    void set_release_delay(Seconds delay) noexcept {
        if (delay > 0.0) {
            release_delay_ = delay;
        }
    }

    // Drop scheduled releases without touching the press state.
    void cancel_pending_releases() noexcept { pending_.clear(); }

    // Release every pressed note (notifying listeners) and drop all timers.
    void clear();

    void set_note_tapped_callback(NoteTappedCallback cb) {
        on_note_tapped_ = std::move(cb);
    }
    void set_state_changed_callback(StateChangedCallback cb) {
        on_state_changed_ = std::move(cb);
    }

private:
    struct PressEntry {
        NotePosition note;
        bool pressed{false};
        InputSource source{InputSource::Pointer};
    };

    struct PendingRelease {
        Seconds deadline{0.0};
        std::string note_name;
    };

    std::unordered_map<std::string, PressEntry> state_;
    std::deque<PendingRelease> pending_;
    Seconds now_{0.0};
    Seconds release_delay_{kPointerReleaseDelay};

    NoteTappedCallback on_note_tapped_{};
    StateChangedCallback on_state_changed_{};

    void schedule_release(const std::string& note_name);
    void drop_pending(const std::string& note_name);
    bool release(const std::string& note_name);
};

const char* to_string(InputSource source) noexcept;

}  // namespace interactive_piano
