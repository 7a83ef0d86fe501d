/**
 * @file TestImages.hpp
 * @brief In-memory fixture images for the unit tests
 */
#ifndef TEST_IMAGES_HPP
#define TEST_IMAGES_HPP

#include <algorithm>
#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <vector>

#include "common/Base64.hpp"
#include "common/Bitmap.hpp"

namespace TestImages {

inline cv::Mat solid(int w, int h, const cv::Scalar& bgra) {
    return cv::Mat(h, w, CV_8UC4, bgra);
}

inline BitmapHandle bitmap(const cv::Mat& bgra, bool extractable = true) {
    return std::make_shared<const Bitmap>(bgra, "test", extractable);
}

// Photo-like content so that transforms are observable
inline cv::Mat gradient(int w, int h) {
    cv::Mat m(h, w, CV_8UC4);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            m.at<cv::Vec4b>(y, x) =
                cv::Vec4b((uchar)(x * 255 / std::max(1, w - 1)),
                          (uchar)(y * 255 / std::max(1, h - 1)),
                          (uchar)((x + y) % 256), 255);
    return m;
}

inline std::vector<unsigned char> png(const cv::Mat& image) {
    std::vector<unsigned char> bytes;
    cv::imencode(".png", image, bytes);
    return bytes;
}

inline std::string pngDataUri(const cv::Mat& image) {
    return "data:image/png;base64," + Base64::encode(png(image));
}

}  // namespace TestImages

#endif
