#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace epubdiff {

// ============================================================================
// Content Digests
// ============================================================================

struct DigestResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex, 40 chars unless truncated
};

// SHA-1 of data as lowercase hex. A nonzero max_hex_chars keeps only that
// many leading characters.
DigestResult sha1_hex(const std::vector<uint8_t>& data, size_t max_hex_chars = 0);

} // namespace epubdiff
