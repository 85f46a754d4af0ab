#include "epubdiff/compare.hpp"
#include "epubdiff/archive.hpp"
#include "epubdiff/content_diff.hpp"
#include "epubdiff/markup_validator.hpp"
#include "epubdiff/package.hpp"
#include "epubdiff/structural_diff.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace epubdiff {

namespace {

const char* const SIDE_ORIG = "orig";
const char* const SIDE_TRAN = "tran";

const char* const CLEAN_HINT =
    "Structures and non-HTML content identical. "
    "If a reader still fails, likely malformed HTML/XHTML content.";

std::string optional_path(const std::optional<std::string>& path) {
    return path ? *path : "(none)";
}

FindingKind mimetype_finding(MimetypeViolation v) {
    switch (v) {
        case MimetypeViolation::Missing: return FindingKind::mimetype_missing;
        case MimetypeViolation::InvalidContent: return FindingKind::mimetype_invalid_content;
        case MimetypeViolation::NotFirst: return FindingKind::mimetype_not_first;
        case MimetypeViolation::Compressed: return FindingKind::mimetype_compressed;
        default: return FindingKind::mimetype_invalid_content;
    }
}

void report_mimetype(ComparisonReport& report, FindingCollector& collector,
                     const char* label, const MimetypeCheck& check) {
    std::string prefix = std::string("[") + label + "] ";

    if (check.present) {
        report.add_line(prefix + "mimetype content: '" + check.content + "', first=" +
                        (check.is_first ? "true" : "false") +
                        ", compress_type=" + std::to_string(check.compression_method) +
                        " (" + compression_method_name(check.compression_method) + ")");
    }

    for (auto v : check.violations) {
        if (v == MimetypeViolation::Missing) {
            report.add_line(prefix + mimetype_violation_to_string(v));
        } else {
            report.add_line(prefix + "ERROR: " + mimetype_violation_to_string(v));
        }
        collector.emit(mimetype_finding(v), MIMETYPE_PATH, label);
    }
}

// Tallies the summary needs after the section that produced them
struct StageOutcome {
    SetDiff files;
    bool mimetype_ok = true;
    bool rootfile_mismatch = false;
    bool manifest_compared = false;
    ManifestDiff manifest;
    ReadingOrderDiff reading_order;
    size_t unresolved_references = 0;
    std::vector<std::string> non_markup_changes;
    size_t unreadable = 0;
    size_t markup_findings = 0;
    size_t malformed = 0;
};

void write_summary(ComparisonReport& report, const StageOutcome& outcome,
                   const CompareOptions& options) {
    report.begin_section("SUMMARY");

    if (!outcome.files.empty()) {
        report.add_line("Files set differs (missing/extra).");
    }
    if (!outcome.mimetype_ok) {
        report.add_line("Mimetype checks failed (see above).");
    }
    if (outcome.rootfile_mismatch) {
        report.add_line("OPF rootfile path differs.");
    }
    if (outcome.manifest_compared) {
        if (!outcome.manifest.paths.empty()) {
            report.add_line("OPF manifest differs.");
        }
        if (!outcome.manifest.media_types.empty()) {
            report.add_line("Media-type differs for " +
                            std::to_string(outcome.manifest.media_types.size()) + " file(s).");
        }
        if (outcome.reading_order.differs()) {
            report.add_line("OPF spine order/length differs.");
        }
    }
    if (outcome.unresolved_references > 0) {
        report.add_line("Manifest references missing from the archive: " +
                        std::to_string(outcome.unresolved_references) + ".");
    }
    if (!outcome.non_markup_changes.empty()) {
        report.add_line("Non-HTML changed files (sample): " +
                        format_capped_list(outcome.non_markup_changes, options.max_summary_samples));
    }
    if (outcome.unreadable > 0) {
        report.add_line("Unreadable common files: " + std::to_string(outcome.unreadable) + ".");
    }
    if (outcome.markup_findings > 0) {
        report.add_line("HTML/XHTML issues detected (see above).");
    }
    if (outcome.malformed > 0) {
        report.add_line("Translated XHTML not well-formed: " +
                        std::to_string(outcome.malformed) + " document(s).");
    }

    bool structure_clean = outcome.files.empty() &&
                           outcome.mimetype_ok &&
                           !outcome.rootfile_mismatch &&
                           outcome.manifest.empty() &&
                           !outcome.reading_order.differs() &&
                           outcome.unresolved_references == 0;
    if (structure_clean && outcome.non_markup_changes.empty() && outcome.unreadable == 0) {
        report.add_line(CLEAN_HINT);
    }
}

} // namespace

CompareResult compare_epub(const std::string& original_path,
                           const std::string& translated_path,
                           const CompareOptions& options) {
    CompareResult result;

    auto orig_open = ZipArchive::open(original_path);
    if (!orig_open.ok) {
        result.error = "original: " + orig_open.error;
        spdlog::error("Cannot open original archive {}: {}", original_path, orig_open.error);
        return result;
    }
    auto tran_open = ZipArchive::open(translated_path);
    if (!tran_open.ok) {
        result.error = "translated: " + tran_open.error;
        spdlog::error("Cannot open translated archive {}: {}", translated_path, tran_open.error);
        return result;
    }

    const ZipArchive& orig = *orig_open.archive;
    const ZipArchive& tran = *tran_open.archive;
    spdlog::info("Comparing {} against {}", original_path, translated_path);

    ComparisonReport& report = result.report;
    FindingCollector collector(options.finding_policy);
    StageOutcome outcome;

    std::set<std::string> orig_files = orig.file_set();
    std::set<std::string> tran_files = tran.file_set();

    report.begin_section("");
    report.add_line("ORIG: " + original_path);
    report.add_line("TRAN: " + translated_path);

    report.begin_section("FILE COUNTS");
    report.add_line("orig files: " + std::to_string(orig.file_list().size()));
    report.add_line("tran files: " + std::to_string(tran.file_list().size()));

    // ------------------------------------------------------------------------
    // File sets
    // ------------------------------------------------------------------------

    report.begin_section("FILE SET DIFF");
    outcome.files = diff_path_sets(orig_files, tran_files);
    if (!outcome.files.missing.empty()) {
        report.add_line("Missing in translated:");
        report.add_line(format_capped_list(outcome.files.missing, options.max_listed_paths));
    }
    if (!outcome.files.extra.empty()) {
        report.add_line("Extra in translated:");
        report.add_line(format_capped_list(outcome.files.extra, options.max_listed_paths));
    }
    if (outcome.files.empty()) {
        report.add_line("file sets identical");
    }
    for (const auto& path : outcome.files.missing) {
        collector.emit(FindingKind::missing_file, path);
    }
    for (const auto& path : outcome.files.extra) {
        collector.emit(FindingKind::extra_file, path);
    }

    // ------------------------------------------------------------------------
    // Mimetype
    // ------------------------------------------------------------------------

    report.begin_section("MIMETYPE CHECKS");
    MimetypeCheck orig_mime = check_mimetype(orig, options.expected_mimetype);
    MimetypeCheck tran_mime = check_mimetype(tran, options.expected_mimetype);
    report_mimetype(report, collector, SIDE_ORIG, orig_mime);
    report_mimetype(report, collector, SIDE_TRAN, tran_mime);
    outcome.mimetype_ok = orig_mime.ok() && tran_mime.ok();

    // ------------------------------------------------------------------------
    // Package documents
    // ------------------------------------------------------------------------

    PackageInfo orig_pkg = load_package(orig, options.text_encoding);
    PackageInfo tran_pkg = load_package(tran, options.text_encoding);

    report.begin_section("OPF PATHS");
    report.add_line("orig OPF: " + optional_path(orig_pkg.rootfile));
    report.add_line("tran OPF: " + optional_path(tran_pkg.rootfile));
    outcome.rootfile_mismatch = rootfiles_differ(orig_pkg.rootfile, tran_pkg.rootfile);
    if (outcome.rootfile_mismatch) {
        report.add_line("ERROR: OPF path differs between original and translated");
        collector.emit(FindingKind::rootfile_mismatch,
                       optional_path(orig_pkg.rootfile) + " vs " + optional_path(tran_pkg.rootfile));
    }

    report.begin_section("OPF MANIFEST & SPINE");
    if (orig_pkg.document && tran_pkg.document) {
        const PackageDocument& orig_doc = *orig_pkg.document;
        const PackageDocument& tran_doc = *tran_pkg.document;
        outcome.manifest_compared = true;

        outcome.manifest = diff_manifests(orig_doc, tran_doc);
        if (!outcome.manifest.paths.missing.empty()) {
            report.add_line("Manifest missing in translated:");
            report.add_line(format_capped_list(outcome.manifest.paths.missing, options.max_listed_paths));
        }
        if (!outcome.manifest.paths.extra.empty()) {
            report.add_line("Manifest extra in translated:");
            report.add_line(format_capped_list(outcome.manifest.paths.extra, options.max_listed_paths));
        }
        for (const auto& path : outcome.manifest.paths.missing) {
            collector.emit(FindingKind::manifest_missing, path);
        }
        for (const auto& path : outcome.manifest.paths.extra) {
            collector.emit(FindingKind::manifest_extra, path);
        }
        for (const auto& mt : outcome.manifest.media_types) {
            report.add_line("MEDIA-TYPE DIFF: " + mt.path + ": " + mt.original + " vs " + mt.translated);
            collector.emit(FindingKind::media_type_mismatch, mt.path);
        }

        outcome.reading_order = diff_reading_order(orig_doc.spine, tran_doc.spine);
        report.add_line("SPINE length: " + std::to_string(outcome.reading_order.original_length) +
                        " vs " + std::to_string(outcome.reading_order.translated_length));
        report.add_line("FIRST SPINE DIFF INDEX: " +
                        (outcome.reading_order.first_divergence
                             ? std::to_string(*outcome.reading_order.first_divergence)
                             : std::string("none")));
        if (outcome.reading_order.differs()) {
            collector.emit(FindingKind::reading_order_mismatch, "spine");
        }
    } else {
        report.add_line(std::string("skipped: package document unavailable in ") +
                        (!orig_pkg.document && !tran_pkg.document ? "both archives"
                         : !orig_pkg.document ? "original" : "translated"));
    }

    report.begin_section("MANIFEST REFERENCES");
    if (orig_pkg.document) {
        for (const auto& path : find_unresolved_references(orig_pkg.document->manifest_paths, orig_files)) {
            report.add_line("ORIG manifest references missing file in zip: " + path);
            collector.emit(FindingKind::manifest_reference_missing, path, SIDE_ORIG);
            ++outcome.unresolved_references;
        }
    }
    if (tran_pkg.document) {
        for (const auto& path : find_unresolved_references(tran_pkg.document->manifest_paths, tran_files)) {
            report.add_line("TRAN manifest references missing file in zip: " + path);
            collector.emit(FindingKind::manifest_reference_missing, path, SIDE_TRAN);
            ++outcome.unresolved_references;
        }
    }
    if (outcome.unresolved_references == 0) {
        report.add_line("all manifest references resolved");
    }

    // ------------------------------------------------------------------------
    // Content
    // ------------------------------------------------------------------------

    report.begin_section("COMMON FILE CONTENT DIFF (first " +
                         std::to_string(options.max_listed_changes) + ")");
    ContentDiff content = diff_contents(orig, tran, options);
    if (content.changes.empty()) {
        report.add_line("no content diffs");
    }
    for (size_t i = 0; i < content.changes.size(); ++i) {
        const auto& change = content.changes[i];
        if (i < options.max_listed_changes) {
            report.add_line(change.describe());
        }
        collector.emit(FindingKind::content_changed, change.path);
    }
    for (const auto& entry : content.unreadable) {
        report.add_line("UNREADABLE: " + entry.path + ": " + entry.error);
        collector.emit(FindingKind::content_unreadable, entry.path);
    }
    outcome.non_markup_changes = content.non_markup_changes;
    outcome.unreadable = content.unreadable.size();

    // ------------------------------------------------------------------------
    // Markup
    // ------------------------------------------------------------------------

    std::vector<MalformedDocument> malformed;
    if (orig_pkg.document && tran_pkg.document) {
        malformed = find_malformed_documents(tran, *orig_pkg.document, *tran_pkg.document, options);
    }
    std::vector<MarkupFinding> markup = validate_changed_markup(content, tran_files, options);
    outcome.malformed = malformed.size();
    outcome.markup_findings = markup.size();

    if (!malformed.empty() || !markup.empty()) {
        report.begin_section("XHTML/HTML ISSUES (translated, sample)");
        if (!malformed.empty()) {
            std::vector<std::string> paths;
            for (const auto& doc : malformed) {
                paths.push_back(doc.path);
                spdlog::debug("{} not well-formed: {}", doc.path, doc.error);
                collector.emit(FindingKind::markup_malformed, doc.path, SIDE_TRAN);
            }
            report.add_line("Translated XHTML not well-formed (sample):");
            report.add_line(format_capped_list(paths, options.max_wellformed_listed));
        }
        for (const auto& finding : markup) {
            report.add_line(finding.describe());
            collector.emit(FindingKind::markup_issue, finding.describe(), SIDE_TRAN);
        }
    }

    write_summary(report, outcome, options);

    result.findings = collector.get_findings();
    result.has_errors = collector.has_errors();
    result.ok = true;

    spdlog::info("Comparison finished: {} findings ({} content changes, {} markup issues)",
                 result.findings.size(), content.changes.size(), markup.size());
    return result;
}

std::string render_result(const CompareResult& result) {
    if (!result.ok) {
        return "ERROR: " + result.error;
    }
    return result.report.render();
}

} // namespace epubdiff
