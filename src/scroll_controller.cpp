#include "interactive_piano/scroll_controller.hpp"

#include "interactive_piano/logger.hpp"

#include <algorithm>
#include <cmath>

namespace interactive_piano {

double apply_curve(ScrollCurve curve, double t) noexcept {
    t = std::clamp(t, 0.0, 1.0);
    switch (curve) {
    case ScrollCurve::Linear:
        return t;
    case ScrollCurve::EaseOut: {
        double inv = 1.0 - t;
        return 1.0 - inv * inv * inv;
    }
    }
    return t;
}

bool ScrollController::check_alive(const char* operation) const {
    if (disposed_) {
        Logger::global()->log_warning(
            "ScrollController::%s called after dispose; ignored", operation);
        return false;
    }
    return true;
}

Pixels ScrollController::clamp(Pixels offset) const noexcept {
    if (!std::isfinite(offset)) {
        return 0.0;
    }
    return std::clamp(offset, 0.0, max_scroll_);
}

void ScrollController::set_position(Pixels offset) {
    Pixels clamped = clamp(offset);
    bool changed = !position_ || *position_ != clamped;
    position_ = clamped;
    if (changed && on_scroll_update) {
        on_scroll_update(clamped);
    }
}

void ScrollController::set_max_scroll(Pixels max_scroll) noexcept {
    if (disposed_) {
        return;
    }
    max_scroll_ = (std::isfinite(max_scroll) && max_scroll > 0.0) ? max_scroll : 0.0;
    if (position_) {
        position_ = clamp(*position_);
    }
    if (animation_) {
        animation_->to = clamp(animation_->to);
    }
}

bool ScrollController::initialize(Pixels offset) {
    if (!check_alive("initialize") || position_) {
        return false;
    }
    set_position(offset);
    return true;
}

void ScrollController::jump_to(Pixels offset) {
    if (!check_alive("jump_to")) {
        return;
    }
    animation_.reset();
    set_position(offset);
}

void ScrollController::animate_to(Pixels offset,
                                  Seconds duration,
                                  ScrollCurve curve) {
    if (!check_alive("animate_to")) {
        return;
    }
    if (!position_ || duration <= 0.0) {
        jump_to(offset);
        return;
    }
    Pixels target = clamp(offset);
    if (target == *position_) {
        animation_.reset();
        return;
    }
    animation_ = Animation{*position_, target, duration, 0.0, curve};
}

std::optional<Pixels> ScrollController::animation_target() const noexcept {
    if (!animation_) {
        return std::nullopt;
    }
    return animation_->to;
}

void ScrollController::advance(Seconds delta_seconds) {
    if (disposed_ || !animation_ || delta_seconds <= 0.0) {
        return;
    }
    Animation& anim = *animation_;
    anim.elapsed += delta_seconds;
    double t = anim.elapsed / anim.duration;
    Pixels value = anim.from + (anim.to - anim.from) * apply_curve(anim.curve, t);
    if (t >= 1.0) {
        value = anim.to;
        animation_.reset();
    }
    set_position(value);
}

void ScrollController::dispose() {
    if (disposed_) {
        Logger::global()->log_warning("ScrollController disposed twice");
        return;
    }
    animation_.reset();
    on_scroll_update = nullptr;
    disposed_ = true;
}

}  // namespace interactive_piano
