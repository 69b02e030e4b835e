#include "interactive_piano/key_state.hpp"

#include "interactive_piano/logger.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace interactive_piano {

bool KeyStateMachine::press_begin(const NotePosition& note, InputSource source) {
    std::string name = note.name();
    PressEntry& entry = state_[name];
    if (entry.pressed) {
        Logger::global()->log_diagnostic(
            "%s press on %s ignored: already pressed",
            to_string(source),
            name.c_str());
        return false;
    }

    entry.note = note;
    entry.pressed = true;
    entry.source = source;

    if (source == InputSource::Pointer) {
        schedule_release(name);
    }

    if (on_note_tapped_) {
        on_note_tapped_(name);
    }
    if (on_state_changed_) {
        on_state_changed_(note, true);
    }
    return true;
}

bool KeyStateMachine::press_end(const NotePosition& note) {
    std::string name = note.name();
    drop_pending(name);
    return release(name);
}

void KeyStateMachine::advance(Seconds delta_seconds) {
    if (delta_seconds > 0.0) {
        now_ += delta_seconds;
    }
    while (!pending_.empty() && pending_.front().deadline <= now_) {
        std::string name = std::move(pending_.front().note_name);
        pending_.pop_front();
        release(name);
    }
}

bool KeyStateMachine::is_pressed(const NotePosition& note) const {
    return is_pressed(note.name());
}

bool KeyStateMachine::is_pressed(std::string_view note_name) const {
    auto it = state_.find(std::string(note_name));
    return it != state_.end() && it->second.pressed;
}

std::optional<InputSource> KeyStateMachine::pressed_source(
    const NotePosition& note) const {
    auto it = state_.find(note.name());
    if (it == state_.end() || !it->second.pressed) {
        return std::nullopt;
    }
    return it->second.source;
}

std::size_t KeyStateMachine::pressed_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(state_.begin(), state_.end(), [](const auto& kv) {
            return kv.second.pressed;
        }));
}

std::optional<Seconds> KeyStateMachine::next_release_deadline() const noexcept {
    if (pending_.empty()) {
        return std::nullopt;
    }
    return pending_.front().deadline;
}

void KeyStateMachine::clear() {
    pending_.clear();
    std::vector<std::string> pressed;
    for (const auto& [name, entry] : state_) {
        if (entry.pressed) {
            pressed.push_back(name);
        }
    }
    for (const std::string& name : pressed) {
        release(name);
    }
    state_.clear();
}

void KeyStateMachine::schedule_release(const std::string& note_name) {
    PendingRelease entry{now_ + release_delay_, note_name};
    auto pos = std::upper_bound(
        pending_.begin(),
        pending_.end(),
        entry.deadline,
        [](Seconds deadline, const PendingRelease& p) {
            return deadline < p.deadline;
        });
    pending_.insert(pos, std::move(entry));
}

void KeyStateMachine::drop_pending(const std::string& note_name) {
    pending_.erase(std::remove_if(pending_.begin(),
                                  pending_.end(),
                                  [&](const PendingRelease& p) {
                                      return p.note_name == note_name;
                                  }),
                   pending_.end());
}

bool KeyStateMachine::release(const std::string& note_name) {
    auto it = state_.find(note_name);
    if (it == state_.end() || !it->second.pressed) {
        return false;
    }
    it->second.pressed = false;
    NotePosition note = it->second.note;
    if (on_state_changed_) {
        on_state_changed_(note, false);
    }
    return true;
}

const char* to_string(InputSource source) noexcept {
    switch (source) {
    case InputSource::Pointer:
        return "pointer";
    case InputSource::Physical:
        return "physical";
    }
    return "unknown";
}

}  // namespace interactive_piano
