#include "common/Bitmap.hpp"

#include <opencv2/imgproc.hpp>
#include <utility>

Bitmap::Bitmap(cv::Mat bgra, std::string sourceId, bool extractable)
    : pixels(bgra), source(std::move(sourceId)), extractable(extractable) {}

cv::Mat toBGRA(const cv::Mat& image) {
    if (image.empty()) return cv::Mat();

    cv::Mat eight = image;
    if (image.depth() == CV_16U) {
        image.convertTo(eight, CV_8U, 1.0 / 257.0);
    } else if (image.depth() != CV_8U) {
        image.convertTo(eight, CV_8U);
    }

    cv::Mat bgra;
    if (eight.channels() == 4) {
        bgra = eight.clone();
    } else if (eight.channels() == 3) {
        cv::cvtColor(eight, bgra, cv::COLOR_BGR2BGRA);
    } else if (eight.channels() == 1) {
        cv::cvtColor(eight, bgra, cv::COLOR_GRAY2BGRA);
    }
    return bgra;
}
