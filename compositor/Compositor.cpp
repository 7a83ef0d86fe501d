#include "compositor/Compositor.hpp"

#include "filters/Filters.hpp"
#include "transforms/Transforms.hpp"

Compositor::Compositor(const CompositorOptions& options) : options_(options) {}

cv::Matx23d Compositor::foregroundPlacement(const cv::Size& background,
                                            const cv::Size& foreground,
                                            const OverlayConfig& state) const {
    cv::Size2d target = Transforms::targetSize(
        background, foreground, state.scale, options_.baselineFraction);
    cv::Point2d center(background.width / 2.0 + state.offsetX,
                       background.height / 2.0 + state.offsetY);
    return Transforms::placementMatrix(foreground, target, center,
                                       state.rotation);
}

bool Compositor::renderTo(Canvas& canvas, const BitmapHandle& background,
                          const BitmapHandle& foreground,
                          const OverlayConfig& state) const {
    if (!background || background->empty()) return false;

    // Native photo resolution, photo as the opaque base layer
    canvas.setBase(background->pixels);

    if (!foreground || foreground->empty()) return true;

    cv::Mat design;
    if (options_.colorAdjust) {
        Filters::applyColorAdjustCPU(foreground->pixels, design, state.hue,
                                     state.saturation, state.brightness);
    } else {
        design = foreground->pixels;
    }

    cv::Matx23d M = foregroundPlacement(background->pixels.size(),
                                        foreground->pixels.size(), state);
    canvas.drawBitmap(design, M, state.blendMode, state.opacity);
    return true;
}

cv::Mat Compositor::render(const BitmapHandle& background,
                           const BitmapHandle& foreground,
                           const OverlayConfig& state) const {
    CpuCanvas canvas;
    if (!renderTo(canvas, background, foreground, state)) return cv::Mat();
    return canvas.pixels();
}
