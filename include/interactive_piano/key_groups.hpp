#pragma once

#include "interactive_piano/note_range.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace interactive_piano {

// Contiguous run of keys drawn as one stacked unit: a row of naturals with
// the accidentals between them overlaid on top. A new group starts wherever
// two naturals are adjacent (E-F and B-C), since no black key sits there.
struct RenderGroup {
    std::vector<NotePosition> positions;

    std::vector<NotePosition> naturals() const;
    std::vector<NotePosition> accidentals() const;

    bool empty() const noexcept { return positions.empty(); }
    std::size_t size() const noexcept { return positions.size(); }
};

// Partition `positions` into render groups. When
// `use_alternative_accidentals` is set, accidentals are respelled with their
// alternative accidental first; ordering and boundaries are unaffected.
//
// The concatenation of the returned groups reproduces the (respelled) input.
// An empty input yields no groups.
std::vector<RenderGroup> group_keys(std::vector<NotePosition> positions,
                                    bool use_alternative_accidentals);

// Respell every accidental with its alternative when one exists.
std::vector<NotePosition> respell_accidentals(std::vector<NotePosition> positions);

// Spelling of a single incoming note as the keyboard displays it. With
// `use_alternative_accidentals` set, sharps become their flat equivalent;
// naturals and flats are returned as given.
NotePosition preferred_spelling(const NotePosition& note,
                                bool use_alternative_accidentals);

// Caches the grouping of a range. Groups are recomputed only when the range
// or the spelling flag differs from the last call, not on every frame.
class KeyGroupCache {
public:
    const std::vector<RenderGroup>& groups(const NoteRange& range,
                                           bool use_alternative_accidentals);

    // Result of the last groups() call.
    const std::vector<RenderGroup>& cached() const noexcept { return groups_; }

    void invalidate() noexcept { key_.reset(); }

    // Number of times the grouping has been recomputed.
    std::size_t recompute_count() const noexcept { return recompute_count_; }

private:
    struct CacheKey {
        NoteRange range;
        bool use_alternative_accidentals;
    };

    std::optional<CacheKey> key_;
    std::vector<RenderGroup> groups_;
    std::size_t recompute_count_{0};
};

}  // namespace interactive_piano
