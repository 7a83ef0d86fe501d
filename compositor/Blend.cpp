#include "compositor/Blend.hpp"

#include <algorithm>

namespace Blend {

float applyChannel(BlendMode mode, float b, float s) {
    switch (mode) {
        case BlendMode::Multiply:
            return b * s;
        case BlendMode::Screen:
            return 1.0f - (1.0f - b) * (1.0f - s);
        case BlendMode::Overlay:
            return b < 0.5f ? 2.0f * b * s
                            : 1.0f - 2.0f * (1.0f - b) * (1.0f - s);
        case BlendMode::Darken:
            return std::min(b, s);
        case BlendMode::Normal:
            return s;
    }
    return s;
}

void compositeCPU(cv::Mat& backdrop, const cv::Mat& layer, BlendMode mode,
                  float opacity) {
    CV_Assert(backdrop.type() == CV_8UC4 && layer.type() == CV_8UC4);
    CV_Assert(backdrop.size() == layer.size());

    const float inv = 1.0f / 255.0f;
    for (int y = 0; y < backdrop.rows; ++y) {
        cv::Vec4b* dst = backdrop.ptr<cv::Vec4b>(y);
        const cv::Vec4b* src = layer.ptr<cv::Vec4b>(y);
        for (int x = 0; x < backdrop.cols; ++x) {
            float as = src[x][3] * inv * opacity;
            if (as <= 0.0f) continue;
            float ab = dst[x][3] * inv;
            float ao = as + ab * (1.0f - as);

            for (int c = 0; c < 3; ++c) {
                float cb = dst[x][c] * inv;
                float cs = src[x][c] * inv;
                float mixed = applyChannel(mode, cb, cs);
                // General source-over; reduces to as*mixed + (1-as)*cb for
                // an opaque backdrop.
                float co = as * (1.0f - ab) * cs + as * ab * mixed +
                           (1.0f - as) * ab * cb;
                dst[x][c] = cv::saturate_cast<uchar>(co / ao * 255.0f);
            }
            dst[x][3] = cv::saturate_cast<uchar>(ao * 255.0f);
        }
    }
}

}  // namespace Blend
