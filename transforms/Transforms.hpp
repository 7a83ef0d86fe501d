/*
 * Transforms.hpp
 *
 * Placement of the design layer on the photo (translate, rotate, scale).
 */
#ifndef TRANSFORMS_HPP
#define TRANSFORMS_HPP

#include <opencv2/core.hpp>

namespace Transforms {

// Size the design is drawn at: `baselineFraction * scale` of the photo width,
// keeping the design's own aspect ratio.
cv::Size2d targetSize(const cv::Size& background, const cv::Size& foreground,
                      double scale, double baselineFraction);

// Affine map from design pixel coordinates to photo pixel coordinates. The
// design's center lands on `center`, is rotated about it by `angleDegrees`
// (positive = clockwise on screen, y pointing down) and stretched to
// `target`.
cv::Matx23d placementMatrix(const cv::Size& source, const cv::Size2d& target,
                            const cv::Point2d& center, double angleDegrees);

// Resamples `src` (BGRA) through `M` into a transparent `canvas`-sized
// frame. Pixels outside the placed image get alpha 0. BGRA input is
// resampled with premultiplied color; the output is straight alpha.
void warpToCanvasCPU(const cv::Mat& src, const cv::Matx23d& M,
                     const cv::Size& canvas, cv::Mat& dst);

}  // namespace Transforms

#endif
