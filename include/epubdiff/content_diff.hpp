#pragma once

#include "epubdiff/options.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace epubdiff {

class ZipArchive;

// Length of the digest prefix shown for each change
static constexpr size_t DIGEST_PREFIX_LENGTH = 10;

// ============================================================================
// Content Changes
// ============================================================================

struct ChangeRecord {
    std::string path;
    uint64_t original_size = 0;
    uint64_t translated_size = 0;
    std::string original_digest;    // SHA-1 hex prefix, empty if hashing failed
    std::string translated_digest;
    bool markup = false;

    // "<path>  (<a> -> <b> bytes)  <digest a> -> <digest b>"
    std::string describe() const;
};

struct UnreadableEntry {
    std::string path;
    std::string error;
};

struct ContentDiff {
    std::vector<std::string> compared;          // Common paths, sorted
    std::vector<ChangeRecord> changes;          // In path order
    std::vector<std::string> markup_changes;    // Paths of changed markup documents
    std::vector<std::string> non_markup_changes;
    std::vector<UnreadableEntry> unreadable;

    // Translated bytes of the first max_validated_markup markup changes
    std::map<std::string, std::vector<uint8_t>> translated_markup;

    bool empty() const { return changes.empty(); }
};

// Markup classification by extension (case-insensitive). The mimetype
// entry is never markup.
bool is_markup_path(const std::string& path, const std::vector<std::string>& extensions);

// Sorted intersection of two path sets
std::vector<std::string> common_paths(const std::set<std::string>& original,
                                      const std::set<std::string>& translated);

// Compare the bytes of every path present in both archives
ContentDiff diff_contents(const ZipArchive& original, const ZipArchive& translated,
                          const CompareOptions& options);

} // namespace epubdiff
