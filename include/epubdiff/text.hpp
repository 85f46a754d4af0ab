#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace epubdiff {

// ============================================================================
// Text Decoding
// ============================================================================

// How undecodable input is handled
enum class DecodePolicy {
    Replace,    // Substitute U+FFFD for each invalid sequence
    Ignore      // Drop invalid sequences
};

// Check if an encoding name is supported (case-insensitive).
// Supported: utf-8, utf8, ascii, us-ascii, latin-1, latin1, iso-8859-1
bool is_known_encoding(const std::string& encoding);

// Decode bytes to a UTF-8 string. Never fails: unknown encodings fall back
// to UTF-8 and invalid sequences are handled according to policy.
std::string decode_text(const std::vector<uint8_t>& bytes,
                        const std::string& encoding = "utf-8",
                        DecodePolicy policy = DecodePolicy::Replace);

// ============================================================================
// String Helpers
// ============================================================================

// ASCII lower-casing
std::string to_lower(const std::string& s);

// Strip leading and trailing whitespace
std::string trim(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

} // namespace epubdiff
