#include "interactive_piano/key_groups.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace interactive_piano {

std::vector<NotePosition> RenderGroup::naturals() const {
    std::vector<NotePosition> out;
    std::copy_if(positions.begin(),
                 positions.end(),
                 std::back_inserter(out),
                 [](const NotePosition& p) { return p.is_natural(); });
    return out;
}

std::vector<NotePosition> RenderGroup::accidentals() const {
    std::vector<NotePosition> out;
    std::copy_if(positions.begin(),
                 positions.end(),
                 std::back_inserter(out),
                 [](const NotePosition& p) { return !p.is_natural(); });
    return out;
}

std::vector<NotePosition> respell_accidentals(std::vector<NotePosition> positions) {
    for (NotePosition& p : positions) {
        if (auto alt = p.alternative_accidental()) {
            p = *alt;
        }
    }
    return positions;
}

NotePosition preferred_spelling(const NotePosition& note,
                                bool use_alternative_accidentals) {
    if (use_alternative_accidentals && note.accidental == Accidental::Sharp) {
        if (auto alt = note.alternative_accidental()) {
            return *alt;
        }
    }
    return note;
}

std::vector<RenderGroup> group_keys(std::vector<NotePosition> positions,
                                    bool use_alternative_accidentals) {
    if (use_alternative_accidentals) {
        positions = respell_accidentals(std::move(positions));
    }

    std::vector<RenderGroup> groups;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        bool starts_group = groups.empty() ||
                            (positions[i].is_natural() &&
                             positions[i - 1].is_natural());
        if (starts_group) {
            groups.emplace_back();
        }
        groups.back().positions.push_back(positions[i]);
    }
    return groups;
}

const std::vector<RenderGroup>& KeyGroupCache::groups(
    const NoteRange& range,
    bool use_alternative_accidentals) {
    if (key_ && key_->range == range &&
        key_->use_alternative_accidentals == use_alternative_accidentals) {
        return groups_;
    }

    groups_ = group_keys(range.all_positions(), use_alternative_accidentals);
    key_ = CacheKey{range, use_alternative_accidentals};
    ++recompute_count_;
    return groups_;
}

}  // namespace interactive_piano
