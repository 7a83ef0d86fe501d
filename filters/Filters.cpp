#include "filters/Filters.hpp"

#include <cmath>

namespace Filters {

// Matrices below are in RGB order, as published for the filter primitives.
static cv::Matx33f hueRotateMatrix(double degrees) {
    const double rad = degrees * CV_PI / 180.0;
    const float c = (float)std::cos(rad);
    const float s = (float)std::sin(rad);
    return cv::Matx33f(
        0.213f + c * 0.787f - s * 0.213f, 0.715f - c * 0.715f - s * 0.715f,
        0.072f - c * 0.072f + s * 0.928f,
        0.213f - c * 0.213f + s * 0.143f, 0.715f + c * 0.285f + s * 0.140f,
        0.072f - c * 0.072f - s * 0.283f,
        0.213f - c * 0.213f - s * 0.787f, 0.715f - c * 0.715f + s * 0.715f,
        0.072f + c * 0.928f + s * 0.072f);
}

static cv::Matx33f saturateMatrix(double percent) {
    const float k = (float)(percent / 100.0);
    return cv::Matx33f(
        0.213f + 0.787f * k, 0.715f - 0.715f * k, 0.072f - 0.072f * k,
        0.213f - 0.213f * k, 0.715f + 0.285f * k, 0.072f - 0.072f * k,
        0.213f - 0.213f * k, 0.715f - 0.715f * k, 0.072f + 0.928f * k);
}

static cv::Matx33f brightnessMatrix(double percent) {
    const float k = (float)(percent / 100.0);
    return cv::Matx33f(k, 0, 0, 0, k, 0, 0, 0, k);
}

// Reorders an RGB matrix for BGR(A) data and pads it to the channel count,
// leaving alpha as identity.
static cv::Mat channelMatrix(const cv::Matx33f& rgb, int channels) {
    static const int order[3] = {2, 1, 0};
    cv::Mat m = cv::Mat::eye(channels, channels, CV_32F);
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            m.at<float>(i, j) = rgb(order[i], order[j]);
    return m;
}

// Applies the matrix to a float frame in [0,1] and clamps the result.
static void transformClamped(cv::Mat& frame32, const cv::Matx33f& rgb) {
    cv::Mat out;
    cv::transform(frame32, out, channelMatrix(rgb, frame32.channels()));
    cv::min(out, 1.0, out);
    cv::max(out, 0.0, frame32);
}

static bool supported(const cv::Mat& frame) {
    return !frame.empty() && frame.depth() == CV_8U &&
           (frame.channels() == 3 || frame.channels() == 4);
}

static void applySingleCPU(cv::Mat& frame, const cv::Matx33f& rgb) {
    if (!supported(frame)) return;
    cv::Mat f;
    frame.convertTo(f, CV_32F, 1.0 / 255.0);
    transformClamped(f, rgb);
    f.convertTo(frame, CV_8U, 255.0);
}

void applyHueRotateCPU(cv::Mat& frame, double degrees) {
    applySingleCPU(frame, hueRotateMatrix(degrees));
}

void applySaturateCPU(cv::Mat& frame, double percent) {
    applySingleCPU(frame, saturateMatrix(percent));
}

void applyBrightnessCPU(cv::Mat& frame, double percent) {
    applySingleCPU(frame, brightnessMatrix(percent));
}

bool isIdentityAdjust(double hueDegrees, double saturationPercent,
                      double brightnessPercent) {
    return std::fmod(hueDegrees, 360.0) == 0.0 && saturationPercent == 100.0 &&
           brightnessPercent == 100.0;
}

void applyColorAdjustCPU(const cv::Mat& src, cv::Mat& dst, double hueDegrees,
                         double saturationPercent, double brightnessPercent) {
    if (!supported(src) ||
        isIdentityAdjust(hueDegrees, saturationPercent, brightnessPercent)) {
        dst = src.clone();
        return;
    }

    cv::Mat f;
    src.convertTo(f, CV_32F, 1.0 / 255.0);
    if (std::fmod(hueDegrees, 360.0) != 0.0)
        transformClamped(f, hueRotateMatrix(hueDegrees));
    if (saturationPercent != 100.0)
        transformClamped(f, saturateMatrix(saturationPercent));
    if (brightnessPercent != 100.0)
        transformClamped(f, brightnessMatrix(brightnessPercent));
    f.convertTo(dst, CV_8U, 255.0);
}

}  // namespace Filters
