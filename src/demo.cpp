#include "interactive_piano/demo.hpp"

#include <deque>
#include <optional>
#include <string>

#ifdef INTERACTIVE_PIANO_USE_IMGUI
#include <imgui.h>
#endif

namespace interactive_piano {

#ifdef INTERACTIVE_PIANO_USE_IMGUI
namespace {

constexpr std::size_t kTapLogSize = 16;

std::deque<std::string>& tap_log() {
    static std::deque<std::string> log;
    return log;
}

void record_tap(const std::string& name) {
    auto& log = tap_log();
    log.push_front(name);
    while (log.size() > kTapLogSize) {
        log.pop_back();
    }
}

}  // namespace
#endif

void RenderInteractivePianoDemo(InteractivePiano& piano) {
#ifdef INTERACTIVE_PIANO_USE_IMGUI
    InteractivePianoConfig cfg = piano.config();
    bool changed = false;

    changed |= ImGui::Checkbox("Flats", &cfg.use_alternative_accidentals);
    ImGui::SameLine();
    changed |= ImGui::Checkbox("Hide names", &cfg.hide_note_names);
    ImGui::SameLine();
    changed |= ImGui::Checkbox("Hide scrollbar", &cfg.hide_scrollbar);
    ImGui::SameLine();
    changed |= ImGui::Checkbox("Animate highlights", &cfg.animate_highlighted_notes);

    // Key width control; 0 selects automatic sizing.
    {
        float width = static_cast<float>(cfg.key_width.value_or(0.0));
        if (ImGui::SliderFloat("Key width", &width, 0.0f, 120.0f, "%.0f px")) {
            cfg.key_width = width > 0.0f ? std::optional<Pixels>(width) : std::nullopt;
            changed = true;
        }
    }

    // Highlight colour control to exercise the colour blending.
    {
        float color[4] = {cfg.highlight_color.r, cfg.highlight_color.g,
                          cfg.highlight_color.b, cfg.highlight_color.a};
        if (ImGui::ColorEdit4("Highlight", color)) {
            cfg.highlight_color = ColorRGBA{color[0], color[1], color[2], color[3]};
            changed = true;
        }
    }

    // Scroll target buttons.
    {
        static const NotePosition kTargets[] = {
            NotePosition(NoteLetter::C, 3),
            NotePosition(NoteLetter::C, 4),
            NotePosition(NoteLetter::C, 5),
        };
        for (const NotePosition& target : kTargets) {
            std::string label = "Go to " + target.name();
            if (ImGui::Button(label.c_str())) {
                cfg.note_to_scroll_to = target;
                changed = true;
            }
            ImGui::SameLine();
        }
        ImGui::NewLine();
    }

    if (changed) {
        piano.set_config(cfg);
    }

    piano.update(static_cast<Seconds>(ImGui::GetIO().DeltaTime));

    ImGui::TextUnformatted("Tapped:");
    for (const std::string& name : tap_log()) {
        ImGui::SameLine();
        ImGui::TextUnformatted(name.c_str());
    }

    ImVec2 avail = ImGui::GetContentRegionAvail();
    if (avail.x <= 0.0f || avail.y <= 0.0f) {
        return;
    }
    ImGui::BeginChild("##piano", avail, false, ImGuiWindowFlags_NoScrollbar);
    piano.draw();
    ImGui::EndChild();
#else
    (void)piano;
    // Built without Dear ImGui: demo does nothing.
#endif
}

void RenderInteractivePianoDemo() {
#ifdef INTERACTIVE_PIANO_USE_IMGUI
    // Lazily initialise shared demo state.
    static InteractivePiano* piano = nullptr;
    if (!piano) {
        InteractivePianoConfig cfg;
        cfg.highlighted_notes = {
            NotePosition(NoteLetter::C, 4),
            NotePosition(NoteLetter::E, 4),
            NotePosition(NoteLetter::G, 4),
        };
        cfg.key_width = 48.0;
        static InteractivePiano instance(
            NoteRange::for_clefs({Clef::Treble, Clef::Bass}, /*extended=*/true),
            cfg);
        instance.set_note_tapped_callback(record_tap);
        piano = &instance;
    }

    RenderInteractivePianoDemo(*piano);
#endif
}

}  // namespace interactive_piano
