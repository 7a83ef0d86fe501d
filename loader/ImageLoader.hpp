/*
 * ImageLoader.hpp
 *
 * Decoding of image sources into bitmaps. A source is a data URI, an
 * http(s) URL (fetched through a host-provided fetcher) or a local file
 * path. Every failure surfaces as DecodeError.
 */
#ifndef IMAGE_LOADER_HPP
#define IMAGE_LOADER_HPP

#include <functional>
#include <string>
#include <vector>

#include "common/Bitmap.hpp"

struct FetchResult {
    std::vector<unsigned char> bytes;
    // False when the server did not grant cross-origin pixel access. The
    // image still displays but the composite can no longer be exported.
    bool crossOriginAllowed = true;
};

// Fetches a remote URL. Throws (any std::exception) on failure.
typedef std::function<FetchResult(const std::string& url)> RemoteFetcher;

namespace ImageLoader {

bool isDataUri(const std::string& source);
bool isRemoteUrl(const std::string& source);

// Short printable form of a source for logs and errors (data URIs are long).
std::string describeSource(const std::string& source);

// Splits "data:<mime>[;base64],<payload>" into its MIME type and bytes.
bool parseDataUri(const std::string& uri, std::string& mimeType,
                  std::vector<unsigned char>& bytes);

// Decodes encoded image bytes (PNG, JPEG, BMP, WebP, ...) to BGRA.
BitmapHandle decodeBytes(const std::vector<unsigned char>& bytes,
                         const std::string& sourceId, bool extractable = true);

// Resolves and decodes any kind of source. `fetcher` may be empty, in which
// case remote URLs fail to load.
BitmapHandle decode(const std::string& source,
                    const RemoteFetcher& fetcher = RemoteFetcher());

}  // namespace ImageLoader

#endif
