#include "interactive_piano/keyboard_geometry.hpp"

#include <algorithm>
#include <cmath>

namespace interactive_piano {

KeyboardGeometry::KeyboardGeometry(Pixels margin)
    : margin_(margin >= 0.0 && std::isfinite(margin) ? margin : kDefaultMargin) {}

void KeyboardGeometry::set_viewport_size(Pixels width, Pixels height) noexcept {
    viewport_.width = (std::isfinite(width) && width > 0.0) ? width : 0.0;
    viewport_.height = (std::isfinite(height) && height > 0.0) ? height : 0.0;
}

void KeyboardGeometry::set_key_width(std::optional<Pixels> width) noexcept {
    if (width && std::isfinite(*width) && *width > 0.0) {
        explicit_key_width_ = *width;
    } else {
        explicit_key_width_.reset();
    }
}

Pixels KeyboardGeometry::key_width() const noexcept {
    if (explicit_key_width_) {
        return *explicit_key_width_;
    }
    if (natural_count_ == 0 || viewport_.width <= margin_) {
        return 0.0;
    }
    return (viewport_.width - margin_) / static_cast<double>(natural_count_);
}

Pixels KeyboardGeometry::content_width() const noexcept {
    return static_cast<double>(natural_count_) * key_width();
}

Pixels KeyboardGeometry::max_scroll() const noexcept {
    return std::max(0.0, content_width() - viewport_.width);
}

std::optional<NaturalIndex> KeyboardGeometry::natural_index_of(
    const NotePosition& target,
    const std::vector<NotePosition>& naturals) const {
    const NotePosition natural = target.natural();
    auto it = std::find(naturals.begin(), naturals.end(), natural);
    if (it == naturals.end()) {
        return std::nullopt;
    }
    return static_cast<NaturalIndex>(std::distance(naturals.begin(), it));
}

Pixels KeyboardGeometry::scroll_offset_for(
    const NotePosition& target,
    const std::vector<NotePosition>& naturals) const {
    const Pixels w = key_width();
    if (w <= 0.0 || viewport_.width <= 0.0) {
        return 0.0;
    }
    auto index = natural_index_of(target, naturals);
    if (!index) {
        return 0.0;
    }
    return static_cast<double>(*index) * w + w / 2.0 - viewport_.width / 2.0;
}

KeyLayout KeyboardGeometry::build_layout(
    const std::vector<RenderGroup>& groups) const {
    KeyLayout layout;
    const Pixels w = key_width();
    const Pixels h = viewport_.height;
    if (w <= 0.0) {
        return layout;
    }

    const Pixels natural_pad = std::ceil(w * kNaturalPaddingFactor);
    const Pixels accidental_pad = std::ceil(w * kAccidentalPaddingFactor);
    const Pixels accidental_h = h * kAccidentalHeightFactor;
    const Pixels pad_y_natural = std::min(kVerticalPadding, h / 2.0);
    const Pixels pad_y_accidental = std::min(kVerticalPadding, accidental_h / 2.0);

    Pixels group_x = 0.0;
    for (std::size_t g = 0; g < groups.size(); ++g) {
        const RenderGroup& group = groups[g];
        const Pixels group_right =
            group_x + static_cast<double>(group.naturals().size()) * w;
        std::size_t natural_i = 0;
        for (const NotePosition& note : group.positions) {
            KeyRect rect;
            rect.note = note;
            rect.group_index = g;
            if (note.is_natural()) {
                Pixels x = group_x + static_cast<double>(natural_i) * w;
                rect.outer = Rect{x, 0.0, x + w, h};
                rect.padding_x = natural_pad;
                rect.padding_y = pad_y_natural;
                ++natural_i;
            } else {
                // Each accidental straddles the boundary after the naturals
                // seen so far in its group. A leading or trailing accidental
                // is clipped to the group's natural span.
                Pixels x = group_x + static_cast<double>(natural_i) * w -
                           w / 2.0 + w * kAccidentalOffsetFactor;
                Pixels left = x;
                Pixels right = x + w;
                if (group_right > group_x) {
                    left = std::max(left, group_x);
                    right = std::min(right, group_right);
                }
                rect.outer = Rect{left, 0.0, right, accidental_h};
                rect.padding_x = accidental_pad;
                rect.padding_y = pad_y_accidental;
                rect.accidental = true;
            }
            layout.push_back(rect);
        }
        group_x += static_cast<double>(natural_i) * w;
    }
    return layout;
}

std::optional<NotePosition> KeyboardGeometry::hit_test(
    const KeyLayout& layout,
    Pixels content_x,
    Pixels content_y) const noexcept {
    for (const KeyRect& rect : layout) {
        if (rect.accidental && rect.body().contains(content_x, content_y)) {
            return rect.note;
        }
    }
    for (const KeyRect& rect : layout) {
        if (!rect.accidental && rect.body().contains(content_x, content_y)) {
            return rect.note;
        }
    }
    return std::nullopt;
}

}  // namespace interactive_piano
