#pragma once

#include "epubdiff/options.hpp"

#include <set>
#include <string>
#include <vector>

namespace epubdiff {

class ZipArchive;
struct ContentDiff;
struct PackageDocument;

inline constexpr const char* XHTML_MEDIA_TYPE = "application/xhtml+xml";

// ============================================================================
// Heuristic Markup Checks
// ============================================================================
//
// These checks are pattern scans over the raw text, not a DOM walk. They
// flag the usual ways a translation pipeline breaks XHTML: lost namespace,
// bare ampersands, HTML-style void elements and dangling resource links.

// True when the path has one of the strict (XHTML) extensions
bool is_strict_markup(const std::string& path, const std::vector<std::string>& strict_extensions);

// Unescaped '&' (not starting &#N;, &#xH; or &name;) anywhere in text
bool has_unescaped_ampersand(const std::string& text);

// An opening <tag ...> of the given void element that does not end in "/>"
bool has_unclosed_void_element(const std::string& text, const std::string& tag);

// Values of src="..." / href="..." attributes in document order
std::vector<std::string> extract_resource_references(const std::string& text);

// Run all checks on one document and return issue messages (unprefixed).
// file_set is the archive the document lives in; references are resolved
// against the document's own directory.
std::vector<std::string> validate_markup(const std::string& path,
                                         const std::string& text,
                                         bool strict,
                                         const std::set<std::string>& file_set);

struct MarkupFinding {
    std::string path;
    std::string issue;

    std::string describe() const { return path + ": " + issue; }
};

// Validate the translated side of changed markup documents (those retained
// in diff.translated_markup), capped at options.max_markup_findings
std::vector<MarkupFinding> validate_changed_markup(const ContentDiff& diff,
                                                   const std::set<std::string>& translated_files,
                                                   const CompareOptions& options);

// ============================================================================
// Well-formedness
// ============================================================================

struct WellFormedResult {
    bool ok = false;
    std::string error;
};

// Full XML parse of a document
WellFormedResult check_well_formed(const std::string& text);

struct MalformedDocument {
    std::string path;
    std::string error;
};

// Parse translated XHTML documents that both manifests list and that the
// original manifest declares as application/xhtml+xml (sorted, at most
// options.max_wellformed_checked documents). Unreadable documents count
// as malformed.
std::vector<MalformedDocument> find_malformed_documents(const ZipArchive& translated,
                                                        const PackageDocument& original_package,
                                                        const PackageDocument& translated_package,
                                                        const CompareOptions& options);

} // namespace epubdiff
