#include <doctest/doctest.h>
#include <epubdiff/findings.hpp>

using namespace epubdiff;

TEST_CASE("finding_to_string returns the canonical key") {
    CHECK(std::string(finding_to_string(FindingKind::missing_file)) == "missing_file");
    CHECK(std::string(finding_to_string(FindingKind::mimetype_compressed)) == "mimetype_compressed");
    CHECK(std::string(finding_to_string(FindingKind::reading_order_mismatch)) == "reading_order_mismatch");
    CHECK(std::string(finding_to_string(FindingKind::markup_malformed)) == "markup_malformed");
}

TEST_CASE("parse_finding_key round-trips every kind") {
    for (int i = static_cast<int>(FindingKind::missing_file);
         i <= static_cast<int>(FindingKind::markup_malformed); ++i) {
        auto kind = static_cast<FindingKind>(i);
        auto parsed = parse_finding_key(finding_to_string(kind));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == kind);
    }
}

TEST_CASE("parse_finding_key is case-insensitive and rejects unknown keys") {
    CHECK(parse_finding_key("Content_Changed") == FindingKind::content_changed);
    CHECK_FALSE(parse_finding_key("").has_value());
    CHECK_FALSE(parse_finding_key("not_a_finding").has_value());
}

TEST_CASE("parse_finding_action") {
    CHECK(parse_finding_action("warn") == FindingAction::Warn);
    CHECK(parse_finding_action("IGNORE") == FindingAction::Ignore);
    CHECK(parse_finding_action("error") == FindingAction::Error);
    CHECK_FALSE(parse_finding_action("fatal").has_value());
    CHECK(std::string(action_to_string(FindingAction::Error)) == "error");
}

TEST_CASE("FindingCollector default policy is warn") {
    FindingCollector collector;
    collector.emit(FindingKind::extra_file, "ch2.xhtml");

    auto findings = collector.get_findings();
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].kind == FindingKind::extra_file);
    CHECK(findings[0].subject == "ch2.xhtml");
    CHECK(findings[0].side.empty());
    CHECK(findings[0].action == FindingAction::Warn);
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("FindingCollector applies error policy") {
    FindingPolicy policy;
    policy["mimetype_compressed"] = FindingAction::Error;

    FindingCollector collector(policy);
    collector.emit(FindingKind::mimetype_compressed, "mimetype", "tran");
    collector.emit(FindingKind::content_changed, "ch1.xhtml");

    auto findings = collector.get_findings();
    REQUIRE(findings.size() == 2);
    CHECK(findings[0].action == FindingAction::Error);
    CHECK(findings[0].side == "tran");
    CHECK(findings[1].action == FindingAction::Warn);
    CHECK(collector.has_errors());
}

TEST_CASE("FindingCollector applies ignore policy") {
    FindingPolicy policy;
    policy["content_changed"] = FindingAction::Ignore;

    FindingCollector collector(policy);
    collector.emit(FindingKind::content_changed, "ch1.xhtml");
    collector.emit(FindingKind::content_changed, "ch2.xhtml");

    CHECK(collector.get_findings().empty());

    collector.emit(FindingKind::missing_file, "img/a.png");
    auto findings = collector.get_findings();
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].kind == FindingKind::missing_file);
}

TEST_CASE("FindingCollector ignored findings never count as errors") {
    FindingPolicy policy;
    policy["markup_issue"] = FindingAction::Ignore;

    FindingCollector collector(policy);
    collector.emit(FindingKind::markup_issue, "ch1.xhtml: unescaped & found");
    CHECK_FALSE(collector.has_errors());
}
