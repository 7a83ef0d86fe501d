/*
 * Blend.hpp
 *
 * Per-pixel blend operators and source-over compositing of a BGRA layer.
 */
#ifndef BLEND_HPP
#define BLEND_HPP

#include <opencv2/core.hpp>

#include "state/OverlayState.hpp"

namespace Blend {

// Blend of backdrop `b` and source `s`, both normalized to [0,1].
float applyChannel(BlendMode mode, float b, float s);

// Composites `layer` over `backdrop` in place. Both are 8-bit BGRA of the
// same size. The layer's own alpha times `opacity` weighs the blended color
// against the backdrop; opacity is not part of the blend formula itself.
void compositeCPU(cv::Mat& backdrop, const cv::Mat& layer, BlendMode mode,
                  float opacity);

}  // namespace Blend

#endif
