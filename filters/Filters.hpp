/*
 * Filters.hpp
 *
 * CPU color adjustments for the design layer.
 * Functions operate on 8-bit BGR (3-channel) or BGRA (4-channel) cv::Mat
 * frames. Alpha is never modified.
 */
#ifndef FILTERS_HPP
#define FILTERS_HPP

#include <opencv2/core.hpp>

namespace Filters {

// Rotates hues by `degrees` using the luminance-preserving hue-rotate matrix.
void applyHueRotateCPU(cv::Mat& frame, double degrees);
// `percent` = 100 keeps the image, 0 gives grayscale, 200 doubles
// saturation.
void applySaturateCPU(cv::Mat& frame, double percent);
// Linear multiplier on every color channel, 100 = unchanged.
void applyBrightnessCPU(cv::Mat& frame, double percent);

// Hue rotation, then saturation, then brightness, clamping to the displayable
// range after every stage. Writes a new frame to `dst`; `src` is left as is
// so the adjustment is never cumulative.
void applyColorAdjustCPU(const cv::Mat& src, cv::Mat& dst, double hueDegrees,
                         double saturationPercent, double brightnessPercent);

// True when the parameters leave every pixel unchanged.
bool isIdentityAdjust(double hueDegrees, double saturationPercent,
                      double brightnessPercent);

}  // namespace Filters

#endif
