#include <doctest/doctest.h>
#include <epubdiff/text.hpp>

using namespace epubdiff;

namespace {

std::vector<uint8_t> bytes(std::initializer_list<int> values) {
    std::vector<uint8_t> out;
    for (int v : values) out.push_back(static_cast<uint8_t>(v));
    return out;
}

} // namespace

TEST_CASE("decode_text passes valid UTF-8 through") {
    // "Привіт"
    auto in = bytes({0xD0, 0x9F, 0xD1, 0x80, 0xD0, 0xB8, 0xD0, 0xB2, 0xD1, 0x96, 0xD1, 0x82});
    CHECK(decode_text(in) == "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD1\x96\xD1\x82");
}

TEST_CASE("decode_text replaces invalid UTF-8") {
    auto in = bytes({'a', 0xFF, 'b'});
    CHECK(decode_text(in) == "a\xEF\xBF\xBD" "b");
}

TEST_CASE("decode_text ignores invalid UTF-8 with ignore policy") {
    auto in = bytes({'a', 0xFF, 'b'});
    CHECK(decode_text(in, "utf-8", DecodePolicy::Ignore) == "ab");
}

TEST_CASE("decode_text handles truncated sequences") {
    auto in = bytes({'x', 0xE2, 0x82});
    CHECK(decode_text(in) == "x\xEF\xBF\xBD");
}

TEST_CASE("decode_text rejects overlong encodings") {
    auto in = bytes({0xC0, 0xAF});
    CHECK(decode_text(in, "utf-8", DecodePolicy::Ignore).empty());
}

TEST_CASE("decode_text ascii drops high bytes with ignore policy") {
    auto in = bytes({'e', 'p', 'u', 'b', 0xE9});
    CHECK(decode_text(in, "ascii", DecodePolicy::Ignore) == "epub");
}

TEST_CASE("decode_text latin-1 maps every byte") {
    auto in = bytes({'c', 'a', 'f', 0xE9});
    CHECK(decode_text(in, "latin-1") == "caf\xC3\xA9");
}

TEST_CASE("decode_text unknown encoding falls back to UTF-8") {
    auto in = bytes({'o', 'k', 0xFF});
    CHECK(decode_text(in, "klingon") == "ok\xEF\xBF\xBD");
}

TEST_CASE("is_known_encoding") {
    CHECK(is_known_encoding("UTF-8"));
    CHECK(is_known_encoding("us-ascii"));
    CHECK(is_known_encoding("ISO-8859-1"));
    CHECK_FALSE(is_known_encoding("cp1251"));
}

TEST_CASE("string helpers") {
    CHECK(to_lower("TOC.XHTML") == "toc.xhtml");
    CHECK(trim("  application/epub+zip\r\n") == "application/epub+zip");
    CHECK(trim("").empty());
    CHECK(starts_with("toc.xhtml", "toc"));
    CHECK_FALSE(starts_with("to", "toc"));
    CHECK(ends_with("ch1.xhtml", ".xhtml"));
    CHECK_FALSE(ends_with("ch1.html", ".xhtml"));
}
