/*
 * Exporter.hpp
 *
 * Lossless encoding of a finished composite.
 */
#ifndef EXPORTER_HPP
#define EXPORTER_HPP

#include <cstdint>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace Export {

struct EncodedImage {
    std::vector<unsigned char> bytes;
    int width = 0;
    int height = 0;
    std::string mimeType = "image/png";

    // "data:image/png;base64,..." reference for direct download.
    std::string toDataUri() const;
    // Returns false if the file cannot be written.
    bool writeToFile(const std::string& path) const;
};

//! encodePng
/*! Encodes an 8-bit 1, 3 or 4 channel image as PNG, keeping alpha. Throws
    ExportError(EncodeFailed) if the image is empty or the codec fails. */
EncodedImage encodePng(const cv::Mat& image);

// "<prefix>-<unixMillis>.png"
std::string makeDownloadName(const std::string& prefix, int64_t unixMillis);
// Same with the current wall clock time.
std::string makeDownloadName(const std::string& prefix);

}  // namespace Export

#endif
