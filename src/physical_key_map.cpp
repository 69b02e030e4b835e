#include "interactive_piano/physical_key_map.hpp"

namespace interactive_piano {

namespace {

constexpr std::array<PhysicalKeyBinding, kPhysicalKeyCount> kBindings{{
    {"C2", '1'},
    {"D2", '2'},
    {"E2", '3'},
    {"F2", 'q'},
    {"G2", 'w'},
    {"A2", 'e'},
    {"B2", 'r'},
    {"C3", 't'},
    {"D3", 'y'},
    {"E3", 'u'},
    {"F3", 'i'},
    {"G3", 'o'},
    {"A3", 'p'},
    {"B3", 'a'},
    {"C4", 's'},
    {"D4", 'd'},
    {"E4", 'f'},
    {"F4", 'g'},
    {"G4", 'h'},
    {"A4", 'j'},
    {"B4", 'k'},
    {"C5", 'l'},
    {"D5", 'z'},
    {"E5", 'x'},
    {"F5", 'c'},
    {"G5", 'v'},
    {"A5", 'b'},
    {"B5", 'n'},
    {"C6", 'm'},
    {"C♯2", '!'},
    {"D♯2", '@'},
    {"F♯2", 'Q'},
    {"G♯2", 'W'},
    {"A♯2", 'E'},
    {"C♯3", 'T'},
    {"D♯3", 'Y'},
    {"F♯3", 'I'},
    {"G♯3", 'O'},
    {"A♯3", 'P'},
    {"C♯4", 'S'},
    {"D♯4", 'D'},
    {"F♯4", 'G'},
    {"G♯4", 'H'},
    {"A♯4", 'J'},
    {"C♯5", 'L'},
    {"D♯5", 'Z'},
    {"F♯5", 'C'},
    {"G♯5", 'V'},
    {"A♯5", 'B'},
}};

}  // namespace

const std::array<PhysicalKeyBinding, kPhysicalKeyCount>& physical_key_bindings() noexcept {
    return kBindings;
}

std::optional<char> label_for_note(std::string_view note_name) noexcept {
    for (const PhysicalKeyBinding& b : kBindings) {
        if (b.note_name == note_name) {
            return b.label;
        }
    }
    return std::nullopt;
}

std::optional<char> label_for_note(const NotePosition& note) {
    if (auto label = label_for_note(note.name())) {
        return label;
    }
    if (auto alt = note.alternative_accidental()) {
        return label_for_note(alt->name());
    }
    return std::nullopt;
}

std::optional<std::string_view> note_for_label(char label) noexcept {
    for (const PhysicalKeyBinding& b : kBindings) {
        if (b.label == label) {
            return b.note_name;
        }
    }
    return std::nullopt;
}

std::optional<NotePosition> note_position_for_label(char label) {
    auto name = note_for_label(label);
    if (!name) {
        return std::nullopt;
    }
    return NotePosition::parse(*name);
}

}  // namespace interactive_piano
