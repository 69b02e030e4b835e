#pragma once

#include "interactive_piano/types.hpp"

#include <functional>
#include <optional>

namespace interactive_piano {

enum class ScrollCurve {
    Linear,
    EaseOut,
};

// Horizontal scroll position of the key strip.
//
// The position starts out unset: the geometry is unknown until the first
// layout pass, which resolves it through initialize(). Afterwards the
// position is moved with jump_to() or with animated transitions driven by
// advance(). Positions are clamped to [0, max_scroll()].
//
// dispose() releases the controller; it must be called once, and every
// mutation after it is ignored.
class ScrollController {
public:
    static constexpr Seconds kDefaultAnimationDuration = 0.5;

    std::optional<Pixels> position() const noexcept { return position_; }
    bool has_position() const noexcept { return position_.has_value(); }

    // Current offset, or 0 before the first measurement.
    Pixels offset() const noexcept { return position_.value_or(0.0); }

    Pixels max_scroll() const noexcept { return max_scroll_; }

    // Update the scrollable extent; the current position is re-clamped.
    void set_max_scroll(Pixels max_scroll) noexcept;

    // Resolve the deferred first value. Returns false if the position was
    // already initialised (or the controller is disposed).
    bool initialize(Pixels offset);

    void jump_to(Pixels offset);

    // Start an animated transition from the current position. Before
    // initialisation this behaves like initialize(offset).
    void animate_to(Pixels offset,
                    Seconds duration = kDefaultAnimationDuration,
                    ScrollCurve curve = ScrollCurve::EaseOut);

    bool is_animating() const noexcept { return animation_.has_value(); }

    // Destination of the running animation, if any.
    std::optional<Pixels> animation_target() const noexcept;

    // Advance the running animation by delta_seconds.
    void advance(Seconds delta_seconds);

    void dispose();
    bool disposed() const noexcept { return disposed_; }

    // Called whenever the position changes.
    std::function<void(Pixels new_position)> on_scroll_update;

private:
    struct Animation {
        Pixels from{0.0};
        Pixels to{0.0};
        Seconds duration{0.0};
        Seconds elapsed{0.0};
        ScrollCurve curve{ScrollCurve::EaseOut};
    };

    std::optional<Pixels> position_;
    std::optional<Animation> animation_;
    Pixels max_scroll_{0.0};
    bool disposed_{false};

    Pixels clamp(Pixels offset) const noexcept;
    void set_position(Pixels offset);
    bool check_alive(const char* operation) const;
};

// Maps animation progress t in [0, 1] through the curve.
double apply_curve(ScrollCurve curve, double t) noexcept;

}  // namespace interactive_piano
