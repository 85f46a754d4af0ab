#pragma once

#include "epubdiff/findings.hpp"
#include "epubdiff/options.hpp"
#include "epubdiff/report.hpp"

#include <string>
#include <vector>

namespace epubdiff {

// ============================================================================
// EPUB Comparison
// ============================================================================

struct CompareResult {
    bool ok = false;
    std::string error;                  // Set when an archive cannot be opened

    ComparisonReport report;
    std::vector<Finding> findings;      // After policy; ignored kinds excluded
    bool has_errors = false;            // Any finding the policy marks as error
};

// Compare an original EPUB against its translated variant.
//
// Only an unreadable archive is fatal. Every other problem (missing
// container, unparsable package document, undecodable text) degrades that
// side to empty data and the remaining stages still run.
//
// Report sections, in order:
//   header             ORIG: / TRAN: lines
//   FILE COUNTS
//   FILE SET DIFF
//   MIMETYPE CHECKS
//   OPF PATHS
//   OPF MANIFEST & SPINE
//   MANIFEST REFERENCES
//   COMMON FILE CONTENT DIFF (first N)
//   XHTML/HTML ISSUES (translated, sample)   only when something was found
//   SUMMARY
CompareResult compare_epub(const std::string& original_path,
                           const std::string& translated_path,
                           const CompareOptions& options = get_default_options());

// Render a comparison to text; a failed comparison renders its error
std::string render_result(const CompareResult& result);

} // namespace epubdiff
