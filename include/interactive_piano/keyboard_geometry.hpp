#pragma once

#include "interactive_piano/key_groups.hpp"
#include "interactive_piano/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace interactive_piano {

// Visible window over the key strip. `x` is the current scroll offset in
// content space; width/height are 0 until the first layout pass.
struct Viewport {
    Pixels x{0.0};
    Pixels width{0.0};
    Pixels height{0.0};
};

struct Rect {
    Pixels left{0.0};
    Pixels top{0.0};
    Pixels right{0.0};
    Pixels bottom{0.0};

    Pixels width() const noexcept { return right - left; }
    Pixels height() const noexcept { return bottom - top; }

    bool contains(Pixels x, Pixels y) const noexcept {
        return x >= left && x < right && y >= top && y < bottom;
    }
};

// Placement of a single key in content space (origin at the left edge of the
// first natural key, y growing downwards).
struct KeyRect {
    NotePosition note;
    Rect outer;
    Pixels padding_x{0.0};
    Pixels padding_y{0.0};
    bool accidental{false};
    std::size_t group_index{0};

    // Visible key body, i.e. the outer rect minus padding.
    Rect body() const noexcept {
        return Rect{outer.left + padding_x,
                    outer.top + padding_y,
                    outer.right - padding_x,
                    outer.bottom - padding_y};
    }
};

using KeyLayout = std::vector<KeyRect>;

// Converts notes into horizontal positions on the natural-key grid. Keys are
// all the same width; accidentals are overlays that add no width of their
// own, so everything is measured against the natural count.
class KeyboardGeometry {
public:
    static constexpr Pixels kDefaultMargin = 2.0;
    static constexpr double kAccidentalHeightFactor = 0.55;
    static constexpr double kAccidentalOffsetFactor = 0.02;
    static constexpr double kNaturalPaddingFactor = 0.02;
    static constexpr double kAccidentalPaddingFactor = 0.04;
    static constexpr Pixels kVerticalPadding = 10.0;

    explicit KeyboardGeometry(Pixels margin = kDefaultMargin);

    const Viewport& viewport() const noexcept { return viewport_; }
    Viewport& viewport() noexcept { return viewport_; }

    // Negative or non-finite sizes are treated as "not measured yet" (0).
    void set_viewport_size(Pixels width, Pixels height) noexcept;

    // Explicit key width; std::nullopt (or a value <= 0) selects automatic
    // sizing so the whole range fills the viewport.
    void set_key_width(std::optional<Pixels> width) noexcept;
    std::optional<Pixels> explicit_key_width() const noexcept {
        return explicit_key_width_;
    }

    void set_natural_count(std::size_t count) noexcept {
        natural_count_ = count;
    }
    std::size_t natural_count() const noexcept { return natural_count_; }

    Pixels margin() const noexcept { return margin_; }

    // Effective key width. Without an explicit width this is
    // (viewport_width - margin) / natural_count, or 0 when unknown.
    Pixels key_width() const noexcept;

    Pixels content_width() const noexcept;

    // Largest scroll offset that keeps the last key inside the viewport.
    Pixels max_scroll() const noexcept;

    bool is_measured() const noexcept {
        return viewport_.width > 0.0 && key_width() > 0.0;
    }

    // Offset that centres `target` in the viewport. Accidentals are measured
    // at their natural. Returns 0 when the natural is not in `naturals` or
    // when the geometry is not known yet. The result is not clamped.
    Pixels scroll_offset_for(const NotePosition& target,
                             const std::vector<NotePosition>& naturals) const;

    // Index of the target's natural within `naturals`.
    std::optional<NaturalIndex> natural_index_of(
        const NotePosition& target,
        const std::vector<NotePosition>& naturals) const;

    KeyLayout build_layout(const std::vector<RenderGroup>& groups) const;

    // Key under a point in content space. Accidentals are tested first since
    // they are drawn on top of the naturals.
    std::optional<NotePosition> hit_test(const KeyLayout& layout,
                                         Pixels content_x,
                                         Pixels content_y) const noexcept;

    Pixels screen_to_content(Pixels screen_x) const noexcept {
        return screen_x + viewport_.x;
    }
    Pixels content_to_screen(Pixels content_x) const noexcept {
        return content_x - viewport_.x;
    }

private:
    Pixels margin_{kDefaultMargin};
    Viewport viewport_{};
    std::optional<Pixels> explicit_key_width_;
    std::size_t natural_count_{0};
};

}  // namespace interactive_piano
