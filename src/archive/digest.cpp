#include "epubdiff/digest.hpp"

#include <openssl/evp.h>

namespace epubdiff {

DigestResult sha1_hex(const std::vector<uint8_t>& data, size_t max_hex_chars) {
    DigestResult result;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha1(), nullptr) != 1) {
        result.error = "EVP_Digest(sha1) failed";
        return result;
    }

    size_t hex_len = static_cast<size_t>(md_len) * 2;
    if (max_hex_chars != 0 && max_hex_chars < hex_len) hex_len = max_hex_chars;

    // Character i is the high nibble of byte i/2 when i is even
    result.hex_digest.resize(hex_len);
    for (size_t i = 0; i < hex_len; ++i) {
        unsigned nibble = (i % 2 == 0) ? (md[i / 2] >> 4) : (md[i / 2] & 0x0F);
        result.hex_digest[i] = "0123456789abcdef"[nibble];
    }
    result.ok = true;
    return result;
}

} // namespace epubdiff
