/*
 * GestureTracker.hpp
 *
 * Turns pointer events on the display surface into overlay updates. Drags
 * move the design (or rotate it when the rotate modifier is held); the wheel
 * and adjustScale zoom it. The tracker never renders, it only writes to the
 * OverlayState.
 */
#ifndef GESTURE_TRACKER_HPP
#define GESTURE_TRACKER_HPP

#include "state/OverlayState.hpp"

struct PointerEvent {
    int id = 0;           // pointer / touch identifier
    bool primary = true;  // false for the 2nd, 3rd... finger of a touch
    double x = 0.0;       // display pixels
    double y = 0.0;
    bool rotate = false;  // rotate modifier (Shift on desktop)
};

//! Size of the rendered bitmap and of the area it is displayed in.
struct DisplayGeometry {
    double nativeWidth = 0.0;
    double nativeHeight = 0.0;
    double displayWidth = 0.0;
    double displayHeight = 0.0;

    bool valid() const {
        return nativeWidth > 0 && nativeHeight > 0 && displayWidth > 0 &&
               displayHeight > 0;
    }
    double ratioX() const { return nativeWidth / displayWidth; }
    double ratioY() const { return nativeHeight / displayHeight; }
};

class GestureTracker {
   public:
    enum class Phase { Idle, Dragging };
    enum class Kind { Translate, Rotate };

    GestureTracker(OverlayState& state, float scaleStep = 0.1f,
                   float rotateSensitivity = 0.35f);

    // Dragging and zooming are disabled while no design is shown. Removing the
    // design ends a gesture in progress.
    void setForegroundPresent(bool present);
    bool foregroundPresent() const { return foregroundPresent_; }

    void setDisplayGeometry(const DisplayGeometry& geometry);
    const DisplayGeometry& displayGeometry() const { return geometry_; }

    //! pointerDown
    /*! Starts a gesture if idle, a design is present and the event comes from
        a primary pointer. Returns true when a gesture started. */
    bool pointerDown(const PointerEvent& event);

    //! pointerMove
    /*! Applies the delta since the last event of the owning pointer. Returns
        true when the overlay state was updated. */
    bool pointerMove(const PointerEvent& event);

    // The three of them end the gesture when sent by the owning pointer.
    void pointerUp(const PointerEvent& event);
    void pointerLeave(const PointerEvent& event);
    void pointerCancel(const PointerEvent& event);

    //! wheel
    /*! One notch per step, positive zooms in. Ignored without a design. */
    bool wheel(double steps);

    //! adjustScale
    /*! Adds `delta` to the scale (clamped). Works in any phase. */
    OverlayConfig adjustScale(float delta);

    Phase phase() const { return phase_; }
    Kind kind() const { return kind_; }
    bool dragging() const { return phase_ == Phase::Dragging; }
    int activePointer() const { return pointerId_; }
    double lastX() const { return lastX_; }
    double lastY() const { return lastY_; }

   private:
    void end(const PointerEvent& event);

    OverlayState& state_;
    float scaleStep_;
    float rotateSensitivity_;
    bool foregroundPresent_ = false;
    DisplayGeometry geometry_;

    Phase phase_ = Phase::Idle;
    Kind kind_ = Kind::Translate;
    int pointerId_ = -1;
    double lastX_ = 0.0, lastY_ = 0.0;
};

#endif
