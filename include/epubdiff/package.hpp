#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace epubdiff {

class ZipArchive;

// ============================================================================
// Package Document (OPF)
// ============================================================================

struct ManifestEntry {
    std::string id;
    std::string path;           // Resolved against the package document directory
    std::string media_type;     // May be empty
};

struct PackageDocument {
    bool ok = false;
    std::string error;

    std::string path;                               // Archive path of the OPF
    std::string namespace_uri;                      // Namespace of the root element
    std::vector<ManifestEntry> manifest;            // Items with an href, document order
    std::vector<std::string> manifest_paths;        // Resolved paths, document order
    std::map<std::string, std::string> media_types; // path -> non-empty media type
    std::vector<std::string> spine;                 // Resolved reading order

    // Declared media type for a path, empty if none
    std::string media_type_of(const std::string& path) const;
};

// Parse package document text. package_path determines the base directory
// used to resolve manifest hrefs.
//
// The namespace is taken from the root element; manifest/item and
// spine/itemref are looked up under that namespace first and, when that
// finds nothing, without a namespace. Spine itemrefs whose idref has no
// manifest entry are skipped.
//
// Unparsable text yields ok = false with empty manifest and spine.
PackageDocument parse_package(const std::string& text, const std::string& package_path);

// ============================================================================
// Package Loading
// ============================================================================

struct PackageInfo {
    std::optional<std::string> rootfile;        // From container.xml
    std::optional<PackageDocument> document;    // Set when the rootfile exists in the archive
};

// Resolve container.xml and parse the referenced package document.
PackageInfo load_package(const ZipArchive& archive, const std::string& encoding = "utf-8");

} // namespace epubdiff
