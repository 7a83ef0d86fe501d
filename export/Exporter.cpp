#include "export/Exporter.hpp"

#include <chrono>
#include <fstream>
#include <opencv2/imgcodecs.hpp>

#include "common/Base64.hpp"
#include "common/Errors.hpp"

namespace Export {

std::string EncodedImage::toDataUri() const {
    return "data:" + mimeType + ";base64," + Base64::encode(bytes);
}

bool EncodedImage::writeToFile(const std::string& path) const {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    file.write(reinterpret_cast<const char*>(bytes.data()),
               (std::streamsize)bytes.size());
    return file.good();
}

EncodedImage encodePng(const cv::Mat& image) {
    if (image.empty())
        throw ExportError(ExportError::Reason::EncodeFailed,
                          "Nothing to encode");
    if (image.depth() != CV_8U)
        throw ExportError(ExportError::Reason::EncodeFailed,
                          "Only 8-bit images can be exported");

    EncodedImage encoded;
    bool ok = false;
    try {
        // Fastest zlib level, the output is still lossless
        std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 1};
        ok = cv::imencode(".png", image, encoded.bytes, params);
    } catch (const cv::Exception& e) {
        throw ExportError(ExportError::Reason::EncodeFailed,
                          std::string("PNG encoder failed: ") + e.what());
    }
    if (!ok || encoded.bytes.empty())
        throw ExportError(ExportError::Reason::EncodeFailed,
                          "PNG encoder produced no data");

    encoded.width = image.cols;
    encoded.height = image.rows;
    return encoded;
}

std::string makeDownloadName(const std::string& prefix, int64_t unixMillis) {
    return prefix + "-" + std::to_string(unixMillis) + ".png";
}

std::string makeDownloadName(const std::string& prefix) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return makeDownloadName(
        prefix,
        (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(now)
            .count());
}

}  // namespace Export
