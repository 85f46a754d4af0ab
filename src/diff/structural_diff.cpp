#include "epubdiff/structural_diff.hpp"
#include "epubdiff/archive.hpp"
#include "epubdiff/package.hpp"
#include "epubdiff/text.hpp"

#include <algorithm>
#include <iterator>

namespace epubdiff {

// ============================================================================
// Set Differences
// ============================================================================

SetDiff diff_path_sets(const std::set<std::string>& original,
                       const std::set<std::string>& translated) {
    SetDiff result;
    std::set_difference(original.begin(), original.end(),
                        translated.begin(), translated.end(),
                        std::back_inserter(result.missing));
    std::set_difference(translated.begin(), translated.end(),
                        original.begin(), original.end(),
                        std::back_inserter(result.extra));
    return result;
}

std::string format_capped_list(const std::vector<std::string>& items, size_t cap) {
    std::string out;
    size_t shown = std::min(cap, items.size());
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    if (items.size() > cap) {
        out += " ...";
    }
    return out;
}

// ============================================================================
// Mimetype Invariants
// ============================================================================

const char* mimetype_violation_to_string(MimetypeViolation v) {
    switch (v) {
        case MimetypeViolation::Missing: return "missing mimetype file";
        case MimetypeViolation::InvalidContent: return "mimetype content invalid";
        case MimetypeViolation::NotFirst: return "mimetype is not first";
        case MimetypeViolation::Compressed: return "mimetype must be STORED (no compression)";
        default: return "unknown mimetype violation";
    }
}

bool MimetypeCheck::has(MimetypeViolation v) const {
    return std::find(violations.begin(), violations.end(), v) != violations.end();
}

MimetypeCheck check_mimetype(const ZipArchive& archive, const std::string& expected) {
    MimetypeCheck check;

    const ArchiveEntry* entry = archive.find(MIMETYPE_PATH);
    if (!entry) {
        check.violations.push_back(MimetypeViolation::Missing);
        return check;
    }

    check.present = true;
    check.is_first = entry->index == 0;
    check.compression_method = entry->method;

    // An unreadable entry leaves the content empty and fails the content check
    auto text = archive.read_text(MIMETYPE_PATH, "ascii", DecodePolicy::Ignore);
    if (text) {
        check.content = trim(*text);
    }

    if (check.content != expected) {
        check.violations.push_back(MimetypeViolation::InvalidContent);
    }
    if (!check.is_first) {
        check.violations.push_back(MimetypeViolation::NotFirst);
    }
    if (!entry->is_stored()) {
        check.violations.push_back(MimetypeViolation::Compressed);
    }
    return check;
}

// ============================================================================
// Package Comparisons
// ============================================================================

bool rootfiles_differ(const std::optional<std::string>& original,
                      const std::optional<std::string>& translated) {
    return original != translated;
}

ManifestDiff diff_manifests(const PackageDocument& original, const PackageDocument& translated) {
    ManifestDiff result;

    std::set<std::string> orig_paths(original.manifest_paths.begin(), original.manifest_paths.end());
    std::set<std::string> tran_paths(translated.manifest_paths.begin(), translated.manifest_paths.end());
    result.paths = diff_path_sets(orig_paths, tran_paths);

    for (const auto& path : orig_paths) {
        if (tran_paths.count(path) == 0) continue;
        std::string mt_orig = original.media_type_of(path);
        std::string mt_tran = translated.media_type_of(path);
        if (mt_orig != mt_tran) {
            result.media_types.push_back({path, mt_orig, mt_tran});
        }
    }
    return result;
}

ReadingOrderDiff diff_reading_order(const std::vector<std::string>& original,
                                    const std::vector<std::string>& translated) {
    ReadingOrderDiff result;
    result.original_length = original.size();
    result.translated_length = translated.size();

    size_t compared = std::min(original.size(), translated.size());
    for (size_t i = 0; i < compared; ++i) {
        if (original[i] != translated[i]) {
            result.first_divergence = i;
            break;
        }
    }
    return result;
}

std::vector<std::string> find_unresolved_references(const std::vector<std::string>& manifest_paths,
                                                    const std::set<std::string>& file_set) {
    std::set<std::string> unresolved;
    for (const auto& path : manifest_paths) {
        if (file_set.count(path) == 0) {
            unresolved.insert(path);
        }
    }
    return std::vector<std::string>(unresolved.begin(), unresolved.end());
}

} // namespace epubdiff
