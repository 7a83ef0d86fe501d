#include "transforms/Transforms.hpp"

#include <cmath>
#include <opencv2/imgproc.hpp>

namespace Transforms {

cv::Size2d targetSize(const cv::Size& background, const cv::Size& foreground,
                      double scale, double baselineFraction) {
    if (foreground.width <= 0) return cv::Size2d(0.0, 0.0);
    double width = background.width * baselineFraction * scale;
    double height =
        width * ((double)foreground.height / (double)foreground.width);
    return cv::Size2d(width, height);
}

cv::Matx23d placementMatrix(const cv::Size& source, const cv::Size2d& target,
                            const cv::Point2d& center, double angleDegrees) {
    // M = T(center) * R(angle) * S(target / source) * T(-source / 2)
    double sx = target.width / (double)source.width;
    double sy = target.height / (double)source.height;
    double ang = angleDegrees * CV_PI / 180.0;
    double ca = std::cos(ang);
    double sa = std::sin(ang);

    // With y down, [c -s; s c] turns clockwise on screen.
    double a = ca * sx, b = -sa * sy;
    double c = sa * sx, d = ca * sy;
    double hx = source.width * 0.5;
    double hy = source.height * 0.5;
    double tx = center.x - (a * hx + b * hy);
    double ty = center.y - (c * hx + d * hy);

    // The above maps continuous coordinates (pixel i spans [i, i+1]).
    // warpAffine addresses pixel centers, so shift by half a pixel on both
    // sides: x_px = M * (i_px + 0.5) - 0.5.
    tx += (a + b) * 0.5 - 0.5;
    ty += (c + d) * 0.5 - 0.5;
    return cv::Matx23d(a, b, tx, c, d, ty);
}

void warpToCanvasCPU(const cv::Mat& src, const cv::Matx23d& M,
                     const cv::Size& canvas, cv::Mat& dst) {
    if (src.empty() || canvas.width <= 0 || canvas.height <= 0) {
        dst.release();
        return;
    }
    if (src.type() != CV_8UC4) {
        cv::warpAffine(src, dst, cv::Mat(M), canvas, cv::INTER_LINEAR,
                       cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
        return;
    }

    // Resample premultiplied color so edge pixels fade in alpha only and do
    // not pick up the black of the transparent border.
    cv::Mat premul;
    src.convertTo(premul, CV_32FC4, 1.0 / 255.0);
    for (int y = 0; y < premul.rows; ++y) {
        cv::Vec4f* p = premul.ptr<cv::Vec4f>(y);
        for (int x = 0; x < premul.cols; ++x) {
            p[x][0] *= p[x][3];
            p[x][1] *= p[x][3];
            p[x][2] *= p[x][3];
        }
    }

    cv::Mat warped;
    cv::warpAffine(premul, warped, cv::Mat(M), canvas, cv::INTER_LINEAR,
                   cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));

    dst.create(canvas, CV_8UC4);
    for (int y = 0; y < warped.rows; ++y) {
        const cv::Vec4f* w = warped.ptr<cv::Vec4f>(y);
        cv::Vec4b* d = dst.ptr<cv::Vec4b>(y);
        for (int x = 0; x < warped.cols; ++x) {
            float a = w[x][3];
            if (a <= 0.0f) {
                d[x] = cv::Vec4b(0, 0, 0, 0);
                continue;
            }
            for (int c = 0; c < 3; ++c)
                d[x][c] = cv::saturate_cast<uchar>(w[x][c] / a * 255.0f);
            d[x][3] = cv::saturate_cast<uchar>(a * 255.0f);
        }
    }
}

}  // namespace Transforms
