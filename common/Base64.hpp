/*
 * Base64.hpp
 *
 * Base64 helpers for data URIs (uploads come in as data references and
 * exports leave as one).
 */
#ifndef BASE64_HPP
#define BASE64_HPP

#include <string>
#include <vector>

namespace Base64 {

std::string encode(const std::vector<unsigned char>& data);

// Decodes standard base64. Whitespace is skipped. Returns false on any other
// character outside the alphabet or on malformed padding.
bool decode(const std::string& text, std::vector<unsigned char>& out);

}  // namespace Base64

#endif
