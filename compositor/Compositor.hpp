/*
 * Compositor.hpp
 *
 * Render pipeline: photo as the base layer, design placed, recolored and
 * blended on top. A render is a pure function of its inputs and always
 * recomputes the whole buffer.
 */
#ifndef COMPOSITOR_HPP
#define COMPOSITOR_HPP

#include <opencv2/core.hpp>

#include "common/Bitmap.hpp"
#include "compositor/Canvas.hpp"
#include "state/OverlayState.hpp"

struct CompositorOptions {
    // Design width at scale 1, relative to the photo width
    double baselineFraction = 0.3;
    // When false the hue / saturation / brightness step is skipped
    bool colorAdjust = true;
};

class Compositor {
   public:
    explicit Compositor(const CompositorOptions& options = CompositorOptions());

    //! render
    /*! Returns the composite at the background's native size, or an empty
        Mat when there is no background. A missing or zero-sized foreground
        yields the background alone. State values are expected in domain. */
    cv::Mat render(const BitmapHandle& background,
                   const BitmapHandle& foreground,
                   const OverlayConfig& state) const;

    //! renderTo
    /*! Same pipeline on a caller-provided canvas. Returns false (canvas
        untouched) when there is no background. */
    bool renderTo(Canvas& canvas, const BitmapHandle& background,
                  const BitmapHandle& foreground,
                  const OverlayConfig& state) const;

    //! foregroundPlacement
    /*! Matrix mapping design pixels to photo pixels for `state`. */
    cv::Matx23d foregroundPlacement(const cv::Size& background,
                                    const cv::Size& foreground,
                                    const OverlayConfig& state) const;

    const CompositorOptions& options() const { return options_; }

   private:
    CompositorOptions options_;
};

#endif
