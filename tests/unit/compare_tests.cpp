#include <doctest/doctest.h>
#include <epubdiff/compare.hpp>

#include "zip_fixture.hpp"

#include <algorithm>

using namespace epubdiff;
using namespace epubdiff_test;

namespace {

const char* const CLEAN_HINT =
    "Structures and non-HTML content identical. "
    "If a reader still fails, likely malformed HTML/XHTML content.";

struct Comparison {
    TempDir dir;
    std::string orig_path;
    std::string tran_path;
    CompareResult result;

    Comparison(const ZipBuilder& orig, const ZipBuilder& tran,
               const CompareOptions& options = CompareOptions{}) {
        orig_path = orig.write(dir.file("book.epub"));
        tran_path = tran.write(dir.file("book_ua.epub"));
        result = compare_epub(orig_path, tran_path, options);
    }

    std::vector<std::string> lines(const std::string& title) const {
        const ReportSection* section = result.report.find_section(title);
        return section ? section->lines : std::vector<std::string>{};
    }

    bool has_line(const std::string& title, const std::string& line) const {
        auto l = lines(title);
        return std::find(l.begin(), l.end(), line) != l.end();
    }

    size_t count(FindingKind kind) const {
        return static_cast<size_t>(std::count_if(result.findings.begin(), result.findings.end(),
            [&](const Finding& f) { return f.kind == kind; }));
    }
};

ZipBuilder two_chapter_epub(const std::vector<std::string>& spine) {
    ZipBuilder zip;
    zip.stored("mimetype", EPUB_MIMETYPE)
       .deflated("META-INF/container.xml", container_xml("OEBPS/content.opf"))
       .deflated("OEBPS/content.opf", package_opf({
           {"ch1", "text/ch1.xhtml", "application/xhtml+xml"},
           {"ch2", "text/ch2.xhtml", "application/xhtml+xml"},
       }, spine))
       .deflated("OEBPS/text/ch1.xhtml", xhtml_page("<p>One</p>"))
       .deflated("OEBPS/text/ch2.xhtml", xhtml_page("<p>Two</p>"));
    return zip;
}

} // namespace

TEST_CASE("identical archives produce a clean report") {
    Comparison c(minimal_epub(), minimal_epub());
    REQUIRE(c.result.ok);
    CHECK(c.result.findings.empty());
    CHECK_FALSE(c.result.has_errors);

    std::string text = c.result.report.render();
    CHECK(text.rfind("ORIG: " + c.orig_path + "\nTRAN: " + c.tran_path + "\n", 0) == 0);

    CHECK(c.has_line("FILE COUNTS", "orig files: 4"));
    CHECK(c.has_line("FILE COUNTS", "tran files: 4"));
    CHECK(c.has_line("FILE SET DIFF", "file sets identical"));
    CHECK(c.has_line("MIMETYPE CHECKS",
                     "[orig] mimetype content: 'application/epub+zip', first=true, compress_type=0 (stored)"));
    CHECK(c.lines("MIMETYPE CHECKS").size() == 2);
    CHECK(c.has_line("OPF PATHS", "orig OPF: content.opf"));
    CHECK(c.lines("OPF PATHS").size() == 2);
    CHECK(c.has_line("OPF MANIFEST & SPINE", "SPINE length: 1 vs 1"));
    CHECK(c.has_line("OPF MANIFEST & SPINE", "FIRST SPINE DIFF INDEX: none"));
    CHECK(c.has_line("MANIFEST REFERENCES", "all manifest references resolved"));
    CHECK(c.has_line("COMMON FILE CONTENT DIFF (first 50)", "no content diffs"));
    CHECK(c.result.report.find_section("XHTML/HTML ISSUES (translated, sample)") == nullptr);
    CHECK(c.lines("SUMMARY") == std::vector<std::string>{CLEAN_HINT});
}

TEST_CASE("sections appear in order") {
    Comparison c(minimal_epub(), minimal_epub("<p>Привіт & світ</p>"));
    REQUIRE(c.result.ok);

    std::vector<std::string> titles;
    for (const auto& s : c.result.report.sections()) {
        titles.push_back(s.title);
    }
    std::vector<std::string> expected = {
        "",
        "FILE COUNTS",
        "FILE SET DIFF",
        "MIMETYPE CHECKS",
        "OPF PATHS",
        "OPF MANIFEST & SPINE",
        "MANIFEST REFERENCES",
        "COMMON FILE CONTENT DIFF (first 50)",
        "XHTML/HTML ISSUES (translated, sample)",
        "SUMMARY",
    };
    CHECK(titles == expected);
}

TEST_CASE("an extra chapter is reported as extra in translated") {
    ZipBuilder tran = minimal_epub();
    tran.deflated("ch2.xhtml", xhtml_page("<p>Two</p>"));

    Comparison c(minimal_epub(), tran);
    REQUIRE(c.result.ok);

    auto file_diff = c.lines("FILE SET DIFF");
    REQUIRE(file_diff.size() == 2);
    CHECK(file_diff[0] == "Extra in translated:");
    CHECK(file_diff[1] == "ch2.xhtml");

    CHECK(c.count(FindingKind::extra_file) == 1);
    CHECK(c.count(FindingKind::missing_file) == 0);
    CHECK(c.has_line("SUMMARY", "Files set differs (missing/extra)."));
    CHECK_FALSE(c.has_line("SUMMARY", CLEAN_HINT));
}

TEST_CASE("a deflated mimetype is the only mimetype finding") {
    ZipBuilder tran;
    tran.deflated("mimetype", EPUB_MIMETYPE)
        .deflated("META-INF/container.xml", container_xml())
        .deflated("content.opf", package_opf({{"ch1", "ch1.xhtml", "application/xhtml+xml"}}, {"ch1"}))
        .deflated("ch1.xhtml", xhtml_page("<p>Hello</p>"));

    Comparison c(minimal_epub(), tran);
    REQUIRE(c.result.ok);

    auto mime = c.lines("MIMETYPE CHECKS");
    REQUIRE(mime.size() == 3);
    CHECK(mime[2] == "[tran] ERROR: mimetype must be STORED (no compression)");

    REQUIRE(c.result.findings.size() == 1);
    CHECK(c.result.findings[0].kind == FindingKind::mimetype_compressed);
    CHECK(c.result.findings[0].side == "tran");
    CHECK(c.has_line("COMMON FILE CONTENT DIFF (first 50)", "no content diffs"));
    CHECK(c.has_line("SUMMARY", "Mimetype checks failed (see above)."));
    CHECK_FALSE(c.has_line("SUMMARY", CLEAN_HINT));
}

TEST_CASE("a missing mimetype is reported without an ERROR prefix") {
    ZipBuilder tran;
    tran.deflated("META-INF/container.xml", container_xml())
        .deflated("content.opf", package_opf({{"ch1", "ch1.xhtml", "application/xhtml+xml"}}, {"ch1"}))
        .deflated("ch1.xhtml", xhtml_page("<p>Hello</p>"));

    Comparison c(minimal_epub(), tran);
    REQUIRE(c.result.ok);
    CHECK(c.has_line("MIMETYPE CHECKS", "[tran] missing mimetype file"));
    CHECK(c.count(FindingKind::mimetype_missing) == 1);
    CHECK(c.count(FindingKind::missing_file) == 1);
}

TEST_CASE("an unclosed img in a changed chapter gives one img finding") {
    ZipBuilder orig = minimal_epub();
    orig.stored("cover.png", "PNG");
    ZipBuilder tran = minimal_epub("<img src=\"cover.png\">");
    tran.stored("cover.png", "PNG");

    Comparison c(orig, tran);
    REQUIRE(c.result.ok);

    auto issues = c.lines("XHTML/HTML ISSUES (translated, sample)");
    CHECK(std::count(issues.begin(), issues.end(), "ch1.xhtml: xhtml <img> not self-closed") == 1);
    CHECK(c.count(FindingKind::markup_issue) == 1);

    // The unclosed element also breaks XML well-formedness
    CHECK(c.has_line("XHTML/HTML ISSUES (translated, sample)", "Translated XHTML not well-formed (sample):"));
    CHECK(c.count(FindingKind::markup_malformed) == 1);

    CHECK(c.count(FindingKind::content_changed) == 1);
    CHECK(c.has_line("SUMMARY", "HTML/XHTML issues detected (see above)."));
    // Only markup changed, so the structural hint still applies
    CHECK(c.has_line("SUMMARY", CLEAN_HINT));
}

TEST_CASE("a relative reference missing from the archive is reported once") {
    ZipBuilder orig = two_chapter_epub({"ch1", "ch2"});
    ZipBuilder tran;
    tran.stored("mimetype", EPUB_MIMETYPE)
        .deflated("META-INF/container.xml", container_xml("OEBPS/content.opf"))
        .deflated("OEBPS/content.opf", package_opf({
            {"ch1", "text/ch1.xhtml", "application/xhtml+xml"},
            {"ch2", "text/ch2.xhtml", "application/xhtml+xml"},
        }, {"ch1", "ch2"}))
        .deflated("OEBPS/text/ch1.xhtml", xhtml_page("<img src=\"img/cover.png\"/>"))
        .deflated("OEBPS/text/ch2.xhtml", xhtml_page("<p>Two</p>"))
        .stored("OEBPS/img/cover.png", "PNG");

    Comparison c(orig, tran);
    REQUIRE(c.result.ok);

    auto issues = c.lines("XHTML/HTML ISSUES (translated, sample)");
    REQUIRE(issues.size() == 1);
    CHECK(issues[0] == "OEBPS/text/ch1.xhtml: missing referenced resource: OEBPS/text/img/cover.png");
}

TEST_CASE("reordered spine reports the first divergence") {
    Comparison c(two_chapter_epub({"ch1", "ch2"}), two_chapter_epub({"ch2", "ch1"}));
    REQUIRE(c.result.ok);

    CHECK(c.has_line("OPF MANIFEST & SPINE", "SPINE length: 2 vs 2"));
    CHECK(c.has_line("OPF MANIFEST & SPINE", "FIRST SPINE DIFF INDEX: 0"));
    CHECK(c.count(FindingKind::reading_order_mismatch) == 1);
    CHECK(c.has_line("SUMMARY", "OPF spine order/length differs."));
    CHECK(c.has_line("SUMMARY", "Non-HTML changed files (sample): OEBPS/content.opf"));
    CHECK_FALSE(c.has_line("SUMMARY", CLEAN_HINT));
}

TEST_CASE("manifest and media-type differences") {
    ZipBuilder orig = minimal_epub();
    ZipBuilder tran;
    tran.stored("mimetype", EPUB_MIMETYPE)
        .deflated("META-INF/container.xml", container_xml())
        .deflated("content.opf", package_opf({
            {"ch1", "ch1.xhtml", "text/html"},
            {"img", "img.png", "image/png"},
        }, {"ch1"}))
        .deflated("ch1.xhtml", xhtml_page("<p>Hello</p>"));

    Comparison c(orig, tran);
    REQUIRE(c.result.ok);

    auto manifest = c.lines("OPF MANIFEST & SPINE");
    CHECK(std::find(manifest.begin(), manifest.end(), "Manifest extra in translated:") != manifest.end());
    CHECK(c.has_line("OPF MANIFEST & SPINE", "img.png"));
    CHECK(c.has_line("OPF MANIFEST & SPINE", "MEDIA-TYPE DIFF: ch1.xhtml: application/xhtml+xml vs text/html"));
    CHECK(c.has_line("MANIFEST REFERENCES", "TRAN manifest references missing file in zip: img.png"));

    CHECK(c.count(FindingKind::manifest_extra) == 1);
    CHECK(c.count(FindingKind::media_type_mismatch) == 1);
    CHECK(c.count(FindingKind::manifest_reference_missing) == 1);

    CHECK(c.has_line("SUMMARY", "OPF manifest differs."));
    CHECK(c.has_line("SUMMARY", "Media-type differs for 1 file(s)."));
}

TEST_CASE("a missing container skips the manifest comparison") {
    ZipBuilder tran;
    tran.stored("mimetype", EPUB_MIMETYPE)
        .deflated("content.opf", package_opf({{"ch1", "ch1.xhtml", "application/xhtml+xml"}}, {"ch1"}))
        .deflated("ch1.xhtml", xhtml_page("<p>Hello</p>"));

    Comparison c(minimal_epub(), tran);
    REQUIRE(c.result.ok);

    CHECK(c.has_line("OPF PATHS", "tran OPF: (none)"));
    CHECK(c.has_line("OPF PATHS", "ERROR: OPF path differs between original and translated"));
    CHECK(c.has_line("OPF MANIFEST & SPINE", "skipped: package document unavailable in translated"));
    CHECK(c.count(FindingKind::rootfile_mismatch) == 1);
    CHECK(c.count(FindingKind::missing_file) == 1);
    CHECK(c.has_line("SUMMARY", "OPF rootfile path differs."));
}

TEST_CASE("an unparsable package document still lets the other stages run") {
    ZipBuilder tran;
    tran.stored("mimetype", EPUB_MIMETYPE)
        .deflated("META-INF/container.xml", container_xml())
        .deflated("content.opf", "<package><manifest>")
        .deflated("ch1.xhtml", xhtml_page("<p>Hello</p>"));

    Comparison c(minimal_epub(), tran);
    REQUIRE(c.result.ok);

    CHECK(c.has_line("OPF MANIFEST & SPINE", "Manifest missing in translated:"));
    CHECK(c.has_line("OPF MANIFEST & SPINE", "SPINE length: 1 vs 0"));
    CHECK(c.count(FindingKind::content_changed) == 1);
    CHECK(c.has_line("SUMMARY", "Non-HTML changed files (sample): content.opf"));
}

TEST_CASE("content change lines are capped") {
    ZipBuilder orig;
    ZipBuilder tran;
    for (int i = 0; i < 4; ++i) {
        std::string name = "data" + std::to_string(i) + ".css";
        orig.stored(name, "a{}");
        tran.stored(name, "b{}");
    }

    CompareOptions options;
    options.max_listed_changes = 2;
    options.max_summary_samples = 1;
    Comparison c(orig, tran, options);
    REQUIRE(c.result.ok);

    CHECK(c.lines("COMMON FILE CONTENT DIFF (first 2)").size() == 2);
    CHECK(c.count(FindingKind::content_changed) == 4);
    CHECK(c.has_line("SUMMARY", "Non-HTML changed files (sample): data0.css ..."));
}

TEST_CASE("finding policy controls findings and has_errors") {
    ZipBuilder tran = minimal_epub("<p>Hallo</p>");
    tran.stored("extra.css", "x");

    CompareOptions options;
    options.finding_policy["content_changed"] = FindingAction::Ignore;
    options.finding_policy["extra_file"] = FindingAction::Error;

    Comparison c(minimal_epub(), tran, options);
    REQUIRE(c.result.ok);
    CHECK(c.count(FindingKind::content_changed) == 0);
    CHECK(c.count(FindingKind::extra_file) == 1);
    CHECK(c.result.has_errors);

    // The report itself is unaffected by the policy
    CHECK(c.lines("COMMON FILE CONTENT DIFF (first 50)").size() == 1);
}

TEST_CASE("an unreadable archive is fatal") {
    TempDir dir;
    std::string orig = minimal_epub().write(dir.file("book.epub"));

    auto r = compare_epub(orig, dir.file("does_not_exist.epub"));
    CHECK_FALSE(r.ok);
    CHECK(r.error.rfind("translated: ", 0) == 0);
    CHECK(r.report.sections().empty());
    CHECK(render_result(r).rfind("ERROR: translated: ", 0) == 0);

    auto r2 = compare_epub(dir.file("does_not_exist.epub"), orig);
    CHECK_FALSE(r2.ok);
    CHECK(r2.error.rfind("original: ", 0) == 0);
}

TEST_CASE("an entry with an inflated size it cannot produce is listed as unreadable") {
    ZipBuilder orig = minimal_epub();
    orig.deflated("style.css", "body { margin: 0 }");
    ZipBuilder tran = minimal_epub();
    tran.deflated("style.css", "body { margin: 0 }").declare_size(0xFFFFFFF0u);

    Comparison c(orig, tran);
    REQUIRE(c.result.ok);
    CHECK(c.has_line("COMMON FILE CONTENT DIFF (first 50)",
                     "UNREADABLE: style.css: tran: failed to inflate: style.css"));
    CHECK(c.count(FindingKind::content_unreadable) == 1);
    CHECK(c.has_line("SUMMARY", "Unreadable common files: 1."));
}
