#pragma once

#include "epubdiff/findings.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace epubdiff {

// ============================================================================
// Comparison Options
// ============================================================================

struct CompareOptions {
    // Display caps
    size_t max_listed_paths = 50;        // missing/extra file and manifest lists
    size_t max_listed_changes = 50;      // content diff lines
    size_t max_validated_markup = 20;    // changed markup documents validated
    size_t max_markup_findings = 50;     // markup issue lines
    size_t max_wellformed_checked = 50;  // XHTML documents parsed for well-formedness
    size_t max_wellformed_listed = 20;   // malformed documents listed
    size_t max_summary_samples = 10;     // non-markup changes named in the summary

    std::string expected_mimetype = "application/epub+zip";
    std::vector<std::string> markup_extensions = {".html", ".xhtml"};
    std::vector<std::string> strict_extensions = {".xhtml"};  // XHTML rules apply
    std::string text_encoding = "utf-8";

    std::string log_level = "info";

    // finding key -> action
    FindingPolicy finding_policy;

    std::string source_path;
};

// Built-in defaults
CompareOptions get_default_options();

struct OptionsParseResult {
    bool ok = false;
    std::string error;
    CompareOptions options;
    std::vector<std::string> warnings;
};

// Parse options from a JSON object. Absent keys keep their defaults;
// invalid values are reported in warnings and also keep their defaults.
//
// {
//   "limits": { "listed_paths": 50, "listed_changes": 50, "validated_markup": 20,
//               "markup_findings": 50, "wellformed_checked": 50,
//               "wellformed_listed": 20, "summary_samples": 10 },
//   "expected_mimetype": "application/epub+zip",
//   "markup_extensions": [".html", ".xhtml"],
//   "strict_extensions": [".xhtml"],
//   "text_encoding": "utf-8",
//   "log_level": "info",
//   "findings": { "content_changed": "ignore" }
// }
OptionsParseResult parse_compare_options(const std::string& json_str,
                                         const std::string& source_path = "");

// Apply options.log_level to the default spdlog logger.
// Accepts trace, debug, info, warn, error, off; anything else means info.
void apply_log_level(const CompareOptions& options);

} // namespace epubdiff
