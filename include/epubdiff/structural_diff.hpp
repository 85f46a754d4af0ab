#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace epubdiff {

class ZipArchive;
struct PackageDocument;

// Path of the OCF mimetype declaration entry
inline constexpr const char* MIMETYPE_PATH = "mimetype";

// ============================================================================
// Set Differences
// ============================================================================

struct SetDiff {
    std::vector<std::string> missing;   // Original only ("missing in translated")
    std::vector<std::string> extra;     // Translated only ("extra in translated")

    bool empty() const { return missing.empty() && extra.empty(); }
};

// Sorted set differences in both directions
SetDiff diff_path_sets(const std::set<std::string>& original,
                       const std::set<std::string>& translated);

// Join items with ", ", keeping at most cap items and appending " ..."
// when the list was truncated
std::string format_capped_list(const std::vector<std::string>& items, size_t cap);

// ============================================================================
// Mimetype Invariants
// ============================================================================

enum class MimetypeViolation {
    Missing,
    InvalidContent,
    NotFirst,
    Compressed
};

const char* mimetype_violation_to_string(MimetypeViolation v);

struct MimetypeCheck {
    bool present = false;
    std::string content;            // ASCII-decoded, whitespace trimmed
    bool is_first = false;          // First entry in listing order
    uint16_t compression_method = 0;
    std::vector<MimetypeViolation> violations;

    bool ok() const { return violations.empty(); }
    bool has(MimetypeViolation v) const;
};

// Check the mimetype entry: present, exact content, first, stored.
// Each violated invariant is reported separately; when the entry is
// missing the remaining checks do not apply.
MimetypeCheck check_mimetype(const ZipArchive& archive, const std::string& expected);

// ============================================================================
// Package Comparisons
// ============================================================================

// True when exactly one side resolves, or both resolve to different paths
bool rootfiles_differ(const std::optional<std::string>& original,
                      const std::optional<std::string>& translated);

struct MediaTypeDiff {
    std::string path;
    std::string original;
    std::string translated;
};

struct ManifestDiff {
    SetDiff paths;
    std::vector<MediaTypeDiff> media_types;    // Common paths, sorted

    bool empty() const { return paths.empty() && media_types.empty(); }
};

ManifestDiff diff_manifests(const PackageDocument& original, const PackageDocument& translated);

struct ReadingOrderDiff {
    size_t original_length = 0;
    size_t translated_length = 0;
    // First index below the shorter length where the two orders differ;
    // nullopt when one is a prefix of the other
    std::optional<size_t> first_divergence;

    bool length_differs() const { return original_length != translated_length; }
    bool differs() const { return length_differs() || first_divergence.has_value(); }
};

ReadingOrderDiff diff_reading_order(const std::vector<std::string>& original,
                                    const std::vector<std::string>& translated);

// Manifest paths that do not exist in the archive's own file set (sorted, unique)
std::vector<std::string> find_unresolved_references(const std::vector<std::string>& manifest_paths,
                                                    const std::set<std::string>& file_set);

} // namespace epubdiff
