#include "epubdiff/findings.hpp"
#include "epubdiff/text.hpp"

namespace epubdiff {

std::optional<FindingKind> parse_finding_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "missing_file") return FindingKind::missing_file;
    if (lower == "extra_file") return FindingKind::extra_file;
    if (lower == "mimetype_missing") return FindingKind::mimetype_missing;
    if (lower == "mimetype_invalid_content") return FindingKind::mimetype_invalid_content;
    if (lower == "mimetype_not_first") return FindingKind::mimetype_not_first;
    if (lower == "mimetype_compressed") return FindingKind::mimetype_compressed;
    if (lower == "rootfile_mismatch") return FindingKind::rootfile_mismatch;
    if (lower == "manifest_missing") return FindingKind::manifest_missing;
    if (lower == "manifest_extra") return FindingKind::manifest_extra;
    if (lower == "media_type_mismatch") return FindingKind::media_type_mismatch;
    if (lower == "reading_order_mismatch") return FindingKind::reading_order_mismatch;
    if (lower == "manifest_reference_missing") return FindingKind::manifest_reference_missing;
    if (lower == "content_changed") return FindingKind::content_changed;
    if (lower == "content_unreadable") return FindingKind::content_unreadable;
    if (lower == "markup_issue") return FindingKind::markup_issue;
    if (lower == "markup_malformed") return FindingKind::markup_malformed;

    return std::nullopt;
}

std::optional<FindingAction> parse_finding_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return FindingAction::Warn;
    if (lower == "ignore") return FindingAction::Ignore;
    if (lower == "error") return FindingAction::Error;
    return std::nullopt;
}

// ============================================================================
// FindingCollector Implementation
// ============================================================================

void FindingCollector::emit(FindingKind kind, const std::string& subject, const std::string& side) {
    findings_.push_back({kind, side, subject, get_effective_action(kind)});
}

std::vector<Finding> FindingCollector::get_findings() const {
    std::vector<Finding> result;
    for (const auto& f : findings_) {
        if (f.action == FindingAction::Ignore) {
            continue;
        }
        result.push_back(f);
    }
    return result;
}

bool FindingCollector::has_errors() const {
    for (const auto& f : findings_) {
        if (f.action == FindingAction::Error) {
            return true;
        }
    }
    return false;
}

FindingAction FindingCollector::get_effective_action(FindingKind kind) const {
    auto it = policy_.find(finding_to_string(kind));
    if (it != policy_.end()) {
        return it->second;
    }
    // Default: warn
    return FindingAction::Warn;
}

} // namespace epubdiff
