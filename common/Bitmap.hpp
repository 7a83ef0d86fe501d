/*
 * Bitmap.hpp
 *
 * Decoded image shared between the loader slots and the renderer.
 */
#ifndef BITMAP_HPP
#define BITMAP_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <string>

//! Decoded image ready to be drawn.
/*! Pixels are always 8-bit BGRA. A Bitmap is never modified after the loader
    hands it out, so handles can be shared freely between a render in flight
    and a newer load. */
struct Bitmap {
    Bitmap(cv::Mat bgra, std::string sourceId, bool extractable = true);

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }
    bool empty() const { return pixels.empty() || width() == 0 || height() == 0; }

    const cv::Mat pixels;
    const std::string source;
    // False when the host denied pixel read-back for this source (a remote
    // image served without cross-origin permission).
    const bool extractable;
};

typedef std::shared_ptr<const Bitmap> BitmapHandle;

// Converts any 1/3/4 channel 8 or 16 bit image to 8-bit BGRA.
cv::Mat toBGRA(const cv::Mat& image);

#endif
