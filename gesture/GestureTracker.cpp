#include "gesture/GestureTracker.hpp"

#include <cmath>

GestureTracker::GestureTracker(OverlayState& state, float scaleStep,
                               float rotateSensitivity)
    : state_(state),
      scaleStep_(scaleStep),
      rotateSensitivity_(rotateSensitivity) {}

void GestureTracker::setForegroundPresent(bool present) {
    foregroundPresent_ = present;
    if (!present) {
        phase_ = Phase::Idle;
        pointerId_ = -1;
    }
}

void GestureTracker::setDisplayGeometry(const DisplayGeometry& geometry) {
    geometry_ = geometry;
}

bool GestureTracker::pointerDown(const PointerEvent& event) {
    if (phase_ != Phase::Idle) return false;
    if (!event.primary || !foregroundPresent_) return false;

    phase_ = Phase::Dragging;
    kind_ = event.rotate ? Kind::Rotate : Kind::Translate;
    pointerId_ = event.id;
    lastX_ = event.x;
    lastY_ = event.y;
    return true;
}

bool GestureTracker::pointerMove(const PointerEvent& event) {
    if (phase_ != Phase::Dragging || event.id != pointerId_) return false;

    double dx = event.x - lastX_;
    double dy = event.y - lastY_;
    lastX_ = event.x;
    lastY_ = event.y;
    if (dx == 0.0 && dy == 0.0) return false;

    const OverlayConfig& current = state_.current();
    if (kind_ == Kind::Rotate) {
        // Display pixels, independent of the photo resolution. Wrapped so a
        // long drag keeps turning past +-180.
        double angle = current.rotation + dx * rotateSensitivity_;
        angle = std::fmod(angle + 180.0, 360.0);
        if (angle < 0.0) angle += 360.0;
        state_.update(OverlayPatch().rotation((float)(angle - 180.0)));
        return true;
    }

    if (!geometry_.valid()) return false;
    // Display pixels -> photo pixels
    double nx = dx * geometry_.ratioX();
    double ny = dy * geometry_.ratioY();
    state_.update(OverlayPatch().offset((float)(current.offsetX + nx),
                                        (float)(current.offsetY + ny)));
    return true;
}

void GestureTracker::end(const PointerEvent& event) {
    if (phase_ != Phase::Dragging || event.id != pointerId_) return;
    phase_ = Phase::Idle;
    pointerId_ = -1;
}

void GestureTracker::pointerUp(const PointerEvent& event) { end(event); }

void GestureTracker::pointerLeave(const PointerEvent& event) { end(event); }

void GestureTracker::pointerCancel(const PointerEvent& event) { end(event); }

bool GestureTracker::wheel(double steps) {
    if (!foregroundPresent_ || steps == 0.0) return false;
    adjustScale((float)(steps * scaleStep_));
    return true;
}

OverlayConfig GestureTracker::adjustScale(float delta) {
    return state_.update(
        OverlayPatch().scale(state_.current().scale + delta));
}
