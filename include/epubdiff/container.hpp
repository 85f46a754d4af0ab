#pragma once

#include <optional>
#include <string>

namespace epubdiff {

class ZipArchive;

// Fixed location of the OCF bootstrap descriptor
inline constexpr const char* CONTAINER_PATH = "META-INF/container.xml";

// ============================================================================
// Container Resolution
// ============================================================================

// Extract the package document path from container.xml text.
// Elements are matched by local name in any namespace; the first <rootfile>
// wins and its "full-path" (or legacy "fullPath") attribute is normalized.
// Returns nullopt for unparsable text or when no rootfile path is declared.
std::optional<std::string> resolve_rootfile(const std::string& container_xml);

// Read container.xml from the archive and resolve the rootfile.
// Returns nullopt when the descriptor is absent or unusable.
std::optional<std::string> read_rootfile_path(const ZipArchive& archive,
                                              const std::string& encoding = "utf-8");

} // namespace epubdiff
