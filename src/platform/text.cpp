#include "epubdiff/text.hpp"

#include <algorithm>
#include <cctype>

namespace epubdiff {

namespace {

enum class Encoding {
    Utf8,
    Ascii,
    Latin1
};

Encoding encoding_from_name(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower == "ascii" || lower == "us-ascii") return Encoding::Ascii;
    if (lower == "latin-1" || lower == "latin1" || lower == "iso-8859-1") return Encoding::Latin1;
    return Encoding::Utf8;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

void invalid_sequence(std::string& out, DecodePolicy policy) {
    if (policy == DecodePolicy::Replace) {
        append_utf8(out, REPLACEMENT_CHARACTER);
    }
}

std::string decode_utf8(const std::vector<uint8_t>& bytes, DecodePolicy policy) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        uint8_t c = bytes[i];
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min_cp = 0x10000;
        } else {
            invalid_sequence(out, policy);
            ++i;
            continue;
        }

        size_t k = 1;
        for (; k < len; ++k) {
            if (i + k >= n || (bytes[i + k] & 0xC0) != 0x80) break;
            cp = (cp << 6) | (bytes[i + k] & 0x3F);
        }

        if (k < len) {
            // Truncated sequence: consume the lead byte and valid continuations
            invalid_sequence(out, policy);
            i += k;
            continue;
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            invalid_sequence(out, policy);
            i += len;
            continue;
        }

        out.append(reinterpret_cast<const char*>(bytes.data() + i), len);
        i += len;
    }
    return out;
}

std::string decode_ascii(const std::vector<uint8_t>& bytes, DecodePolicy policy) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t c : bytes) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            invalid_sequence(out, policy);
        }
    }
    return out;
}

std::string decode_latin1(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t c : bytes) {
        append_utf8(out, c);
    }
    return out;
}

} // namespace

bool is_known_encoding(const std::string& encoding) {
    std::string lower = to_lower(trim(encoding));
    return lower == "utf-8" || lower == "utf8" ||
           lower == "ascii" || lower == "us-ascii" ||
           lower == "latin-1" || lower == "latin1" || lower == "iso-8859-1";
}

std::string decode_text(const std::vector<uint8_t>& bytes,
                        const std::string& encoding,
                        DecodePolicy policy) {
    switch (encoding_from_name(encoding)) {
        case Encoding::Ascii:
            return decode_ascii(bytes, policy);
        case Encoding::Latin1:
            return decode_latin1(bytes);
        case Encoding::Utf8:
            break;
    }
    return decode_utf8(bytes, policy);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace epubdiff
