#include "utils/FileId.hpp"
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace Yturl {

std::string FileId::generate() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    // Version 4, variant 10xx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return buffer;
}

bool FileId::isValid(const std::string& id) {
    if (id.size() != 36) {
        return false;
    }

    for (size_t i = 0; i < id.size(); ++i) {
        char c = id[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool base64UrlDecode(const std::string& input, std::string& output) {
    std::string b64;
    b64.reserve(input.size() + 3);
    for (char c : input) {
        if (c == '-') b64 += '+';
        else if (c == '_') b64 += '/';
        else if (c == '=' || std::isalnum(static_cast<unsigned char>(c))) b64 += c;
        else return false;
    }

    // Strip padding, then re-pad to a multiple of four
    while (!b64.empty() && b64.back() == '=') {
        b64.pop_back();
    }
    if (b64.empty() || b64.size() % 4 == 1 || b64.find('=') != std::string::npos) {
        return false;
    }
    while (b64.size() % 4 != 0) {
        b64 += '=';
    }

    BIO* bio = BIO_new_mem_buf(b64.data(), static_cast<int>(b64.size()));
    BIO* decoder = BIO_new(BIO_f_base64());
    BIO_set_flags(decoder, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(decoder, bio);

    std::vector<char> buffer(b64.size());
    int length = BIO_read(bio, buffer.data(), static_cast<int>(buffer.size()));
    BIO_free_all(bio);

    if (length <= 0) {
        return false;
    }
    output.assign(buffer.data(), static_cast<size_t>(length));
    return true;
}

std::string base64UrlEncode(const std::string& input) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, input.data(), static_cast<int>(input.size()));
    BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    // Convert base64 to base64url
    for (auto& c : result) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return result;
}

} // namespace Yturl
