#include <doctest/doctest.h>
#include <epubdiff/archive.hpp>
#include <epubdiff/container.hpp>

#include "zip_fixture.hpp"

using namespace epubdiff;
using namespace epubdiff_test;

TEST_CASE("resolve_rootfile reads full-path") {
    auto r = resolve_rootfile(container_xml("OEBPS/content.opf"));
    REQUIRE(r.has_value());
    CHECK(*r == "OEBPS/content.opf");
}

TEST_CASE("resolve_rootfile matches elements in any namespace") {
    const char* xml = R"(<?xml version="1.0"?>
<c:container xmlns:c="urn:oasis:names:tc:opendocument:xmlns:container" version="1.0">
  <c:rootfiles>
    <c:rootfile full-path="book.opf" media-type="application/oebps-package+xml"/>
  </c:rootfiles>
</c:container>)";
    auto r = resolve_rootfile(xml);
    REQUIRE(r.has_value());
    CHECK(*r == "book.opf");
}

TEST_CASE("resolve_rootfile works without a namespace") {
    auto r = resolve_rootfile("<container><rootfiles><rootfile full-path=\"a.opf\"/></rootfiles></container>");
    REQUIRE(r.has_value());
    CHECK(*r == "a.opf");
}

TEST_CASE("resolve_rootfile accepts the legacy fullPath spelling") {
    auto r = resolve_rootfile("<container><rootfiles><rootfile fullPath=\"./OPS/pkg.opf\"/></rootfiles></container>");
    REQUIRE(r.has_value());
    CHECK(*r == "OPS/pkg.opf");
}

TEST_CASE("resolve_rootfile uses the first rootfile") {
    auto r = resolve_rootfile(
        "<container><rootfiles>"
        "<rootfile full-path=\"first.opf\"/>"
        "<rootfile full-path=\"second.opf\"/>"
        "</rootfiles></container>");
    REQUIRE(r.has_value());
    CHECK(*r == "first.opf");
}

TEST_CASE("resolve_rootfile returns nullopt when unusable") {
    CHECK_FALSE(resolve_rootfile("").has_value());
    CHECK_FALSE(resolve_rootfile("<container><rootfiles>").has_value());
    CHECK_FALSE(resolve_rootfile("<container><rootfiles/></container>").has_value());
    CHECK_FALSE(resolve_rootfile("<container><rootfiles><rootfile/></rootfiles></container>").has_value());
}

TEST_CASE("read_rootfile_path reads container.xml from the archive") {
    TempDir dir;
    auto with = ZipArchive::open(minimal_epub().write(dir.file("with.epub")));
    REQUIRE(with.ok);
    auto r = read_rootfile_path(*with.archive);
    REQUIRE(r.has_value());
    CHECK(*r == "content.opf");

    auto without = ZipArchive::open(ZipBuilder().stored("mimetype", EPUB_MIMETYPE).write(dir.file("without.epub")));
    REQUIRE(without.ok);
    CHECK_FALSE(read_rootfile_path(*without.archive).has_value());
}
