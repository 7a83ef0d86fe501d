#include "loader/ImageLoader.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <opencv2/imgcodecs.hpp>

#include "common/Base64.hpp"
#include "common/Errors.hpp"

namespace ImageLoader {

static bool startsWithNoCase(const std::string& s, const char* prefix) {
    size_t i = 0;
    for (; prefix[i] != '\0'; ++i) {
        if (i >= s.size()) return false;
        if (tolower((unsigned char)s[i]) != prefix[i]) return false;
    }
    return true;
}

bool isDataUri(const std::string& source) {
    return startsWithNoCase(source, "data:");
}

bool isRemoteUrl(const std::string& source) {
    return startsWithNoCase(source, "http://") ||
           startsWithNoCase(source, "https://");
}

std::string describeSource(const std::string& source) {
    if (!isDataUri(source)) return source;
    size_t comma = source.find(',');
    std::string head =
        comma == std::string::npos ? source.substr(0, 32) : source.substr(0, comma);
    return head + ",<" + std::to_string(source.size()) + " bytes>";
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseDataUri(const std::string& uri, std::string& mimeType,
                  std::vector<unsigned char>& bytes) {
    if (!isDataUri(uri)) return false;
    size_t comma = uri.find(',');
    if (comma == std::string::npos) return false;

    std::string meta = uri.substr(5, comma - 5);
    std::string payload = uri.substr(comma + 1);

    bool base64 = false;
    const std::string marker = ";base64";
    if (meta.size() >= marker.size()) {
        std::string tail = meta.substr(meta.size() - marker.size());
        for (auto& c : tail) c = (char)tolower((unsigned char)c);
        if (tail == marker) {
            base64 = true;
            meta.erase(meta.size() - marker.size());
        }
    }
    mimeType = meta.substr(0, meta.find(';'));
    if (mimeType.empty()) mimeType = "text/plain";

    if (base64) return Base64::decode(payload, bytes);

    bytes.clear();
    bytes.reserve(payload.size());
    for (size_t i = 0; i < payload.size(); ++i) {
        if (payload[i] == '%') {
            if (i + 2 >= payload.size()) return false;
            int hi = hexValue(payload[i + 1]);
            int lo = hexValue(payload[i + 2]);
            if (hi < 0 || lo < 0) return false;
            bytes.push_back((unsigned char)(hi * 16 + lo));
            i += 2;
        } else {
            bytes.push_back((unsigned char)payload[i]);
        }
    }
    return true;
}

BitmapHandle decodeBytes(const std::vector<unsigned char>& bytes,
                         const std::string& sourceId, bool extractable) {
    if (bytes.empty()) throw DecodeError(sourceId, "no image data");

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(sourceId, e.what());
    }
    if (decoded.empty()) throw DecodeError(sourceId, "unsupported or corrupt image");

    cv::Mat bgra = toBGRA(decoded);
    if (bgra.empty() || bgra.cols == 0 || bgra.rows == 0)
        throw DecodeError(sourceId, "unsupported pixel format");
    return std::make_shared<const Bitmap>(bgra, sourceId, extractable);
}

static std::vector<unsigned char> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) throw DecodeError(path, "cannot open file");
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
    if (file.bad()) throw DecodeError(path, "read error");
    return bytes;
}

BitmapHandle decode(const std::string& source, const RemoteFetcher& fetcher) {
    if (source.empty()) throw DecodeError(source, "empty source");

    if (isDataUri(source)) {
        std::string id = describeSource(source);
        std::string mime;
        std::vector<unsigned char> bytes;
        if (!parseDataUri(source, mime, bytes))
            throw DecodeError(id, "malformed data URI");
        return decodeBytes(bytes, id);
    }

    if (isRemoteUrl(source)) {
        if (!fetcher) throw DecodeError(source, "no fetcher for remote images");
        FetchResult fetched;
        try {
            fetched = fetcher(source);
        } catch (const std::exception& e) {
            throw DecodeError(source, std::string("fetch failed: ") + e.what());
        }
        return decodeBytes(fetched.bytes, source, fetched.crossOriginAllowed);
    }

    return decodeBytes(readFile(source), source);
}

}  // namespace ImageLoader
