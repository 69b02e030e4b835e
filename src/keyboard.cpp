#include "interactive_piano/keyboard.hpp"

#include "interactive_piano/key_groups.hpp"
#include "interactive_piano/logger.hpp"

namespace interactive_piano {

char apply_shift(char base, bool shift) noexcept {
    if (!shift) {
        return base;
    }
    if (base >= 'a' && base <= 'z') {
        return static_cast<char>(base - 'a' + 'A');
    }
    switch (base) {
    case '1':
        return '!';
    case '2':
        return '@';
    case '3':
        return '#';
    case '4':
        return '$';
    case '5':
        return '%';
    case '6':
        return '^';
    case '7':
        return '&';
    case '8':
        return '*';
    case '9':
        return '(';
    case '0':
        return ')';
    default:
        return base;
    }
}

KeyboardController::KeyboardController(KeyStateMachine& keys)
    : keys_(&keys) {}

std::optional<NotePosition> KeyboardController::resolve(char label) const {
    auto note = note_position_for_label(label);
    if (!note) {
        return std::nullopt;
    }
    return preferred_spelling(*note, use_alternative_accidentals_);
}

bool KeyboardController::on_key_event(char label, KeyAction action) {
    if (!keys_) {
        return false;
    }

    auto note = resolve(label);
    if (!note) {
        Logger::global()->log_diagnostic("No note mapped to key '%c'", label);
        return false;
    }

    switch (action) {
    case KeyAction::Down:
    case KeyAction::Repeat:
        keys_->press_begin(*note, InputSource::Physical);
        break;
    case KeyAction::Up:
        keys_->press_end(*note);
        break;
    }
    return true;
}

}  // namespace interactive_piano
