#include "compositor/Canvas.hpp"

#include "compositor/Blend.hpp"
#include "transforms/Transforms.hpp"

void CpuCanvas::setBase(const cv::Mat& bgra) { buffer_ = bgra.clone(); }

void CpuCanvas::drawBitmap(const cv::Mat& bgra, const cv::Matx23d& transform,
                           BlendMode mode, float alpha) {
    if (buffer_.empty() || bgra.empty() || alpha <= 0.0f) return;
    Transforms::warpToCanvasCPU(bgra, transform, buffer_.size(), layer_);
    Blend::compositeCPU(buffer_, layer_, mode, alpha);
}
