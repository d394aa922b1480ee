#pragma once

#include <string>

namespace Yturl {

/**
 * Random file identifiers
 * Ids are RFC 4122 version 4 UUIDs in lowercase text form and double as the
 * temp file stem, so validation doubles as path-traversal protection
 */
class FileId {
public:
    // Generate a fresh id from the OpenSSL CSPRNG
    static std::string generate();

    // Accepts any-case canonical 8-4-4-4-12 hex text
    static bool isValid(const std::string& id);
};

/**
 * Decode base64url text (padding optional) via OpenSSL BIO
 * Returns false on malformed input
 */
bool base64UrlDecode(const std::string& input, std::string& output);

/**
 * Encode bytes as padded base64url
 */
std::string base64UrlEncode(const std::string& input);

} // namespace Yturl
